#pragma once

/**
 * Catalog.hpp
 *
 * Collaborators that turn a recording id into the files to download:
 * a catalog resolver listing candidate files and a format filter
 * narrowing them to one file per song.
 */

#include "DownloadTask.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tapedeck::core::downloader {

/**
 * ICatalogResolver - recording id to candidate files
 */
class ICatalogResolver {
public:
    virtual ~ICatalogResolver() = default;

    /**
     * @return Candidate files, or nullopt if the recording is unknown
     */
    virtual std::optional<std::vector<TrackFile>> resolve(const std::string& recordingId) = 0;
};

/**
 * IFormatFilter - keep the files worth downloading
 */
class IFormatFilter {
public:
    virtual ~IFormatFilter() = default;

    virtual std::vector<TrackFile> filter(const std::vector<TrackFile>& files,
                                          const std::vector<std::string>& formatPreferences) const = 0;
};

/**
 * PreferenceFormatFilter - one file per song, best ranked format wins
 *
 * Files are grouped by song (lowercased filename stem with special
 * characters folded to '_'). Within a group the format with the lowest
 * preference index wins; equal ranks fall back to a quality score
 * (flac > vbr > ogg > mp3 by bitrate). The result is sorted by filename.
 * An empty preference list returns the input unchanged.
 */
class PreferenceFormatFilter : public IFormatFilter {
public:
    std::vector<TrackFile> filter(const std::vector<TrackFile>& files,
                                  const std::vector<std::string>& formatPreferences) const override;

    static std::string songIdentifier(const std::string& filename);
    static int formatRank(const std::string& format, const std::vector<std::string>& formatPreferences);
    static bool formatMatches(const std::string& format, const std::string& preference);
    static int qualityScore(const std::string& format);
};

/**
 * JsonManifestResolver - catalog backed by JSON manifests on disk
 *
 * Manifest layout:
 * {
 *   "baseUrl": "https://host/download/<recording>",   (optional)
 *   "files": [{"filename", "format", "size", "url", "sha1"}, ...]
 * }
 * A file without "url" is fetched from baseUrl + "/" + filename.
 * Manifests are looked up by explicit registration first, then as
 * <manifestDir>/<recordingId>.json.
 */
class JsonManifestResolver : public ICatalogResolver {
public:
    explicit JsonManifestResolver(std::filesystem::path manifestDir = {});

    void registerManifest(const std::string& recordingId, const std::filesystem::path& path);

    std::optional<std::vector<TrackFile>> resolve(const std::string& recordingId) override;

    /**
     * Parse a manifest document
     * @throws nlohmann::json::exception on malformed input,
     *         std::invalid_argument for a file without a url
     */
    static std::vector<TrackFile> parseManifest(const json& manifest);

private:
    std::filesystem::path m_manifestDir;
    std::map<std::string, std::filesystem::path> m_registered;
    std::mutex m_mutex;
};

} // namespace tapedeck::core::downloader
