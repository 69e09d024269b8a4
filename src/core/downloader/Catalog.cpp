/**
 * Catalog.cpp
 *
 * Format preference filter and JSON manifest catalog.
 */

#include "Catalog.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>

namespace tapedeck::core::downloader {

using utils::StringUtils;

// -- PreferenceFormatFilter --

std::string PreferenceFormatFilter::songIdentifier(const std::string& filename) {
    auto dot = filename.rfind('.');
    std::string stem = StringUtils::toLower(dot == std::string::npos ? filename : filename.substr(0, dot));

    std::string result;
    for (char c : stem) {
        bool keep = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
        char out = keep ? c : '_';
        if (out == '_' && !result.empty() && result.back() == '_') {
            continue;
        }
        result += out;
    }

    auto first = result.find_first_not_of('_');
    if (first == std::string::npos) {
        return "";
    }
    auto last = result.find_last_not_of('_');
    return result.substr(first, last - first + 1);
}

bool PreferenceFormatFilter::formatMatches(const std::string& format, const std::string& preference) {
    auto f = StringUtils::toLower(StringUtils::trim(format));
    auto p = StringUtils::toLower(StringUtils::trim(preference));

    if (f == p) return true;
    if (p == "mp3") return StringUtils::contains(f, "mp3");
    if (p == "vbr mp3") return StringUtils::contains(f, "vbr");
    if (p == "ogg vorbis") return StringUtils::contains(f, "ogg") || StringUtils::contains(f, "vorbis");
    if (p == "ogg") return StringUtils::contains(f, "ogg");
    if (p == "flac") return StringUtils::contains(f, "flac");
    return false;
}

int PreferenceFormatFilter::formatRank(const std::string& format, const std::vector<std::string>& formatPreferences) {
    for (size_t i = 0; i < formatPreferences.size(); ++i) {
        if (formatMatches(format, formatPreferences[i])) {
            return static_cast<int>(i);
        }
    }
    return static_cast<int>(formatPreferences.size()) + 100;
}

int PreferenceFormatFilter::qualityScore(const std::string& format) {
    auto f = StringUtils::toLower(format);

    if (StringUtils::contains(f, "flac")) return 100;
    if (StringUtils::contains(f, "vbr")) return 80;
    if (StringUtils::contains(f, "ogg")) return 70;
    if (StringUtils::contains(f, "mp3")) {
        // First number in the format name is the bitrate ("320Kbps MP3")
        int bitrate = 192;
        auto digit = std::find_if(f.begin(), f.end(), [](unsigned char c) { return std::isdigit(c); });
        if (digit != f.end()) {
            auto end = std::find_if(digit, f.end(), [](unsigned char c) { return !std::isdigit(c); });
            std::string digits(digit, end);
            if (digits.size() < 6) {
                bitrate = std::stoi(digits);
            }
        }
        if (bitrate >= 320) return 60;
        if (bitrate >= 256) return 50;
        if (bitrate >= 192) return 40;
        return 30;
    }
    return 20;
}

std::vector<TrackFile> PreferenceFormatFilter::filter(const std::vector<TrackFile>& files,
                                                      const std::vector<std::string>& formatPreferences) const {
    if (files.empty() || formatPreferences.empty()) {
        return files;
    }

    std::map<std::string, std::vector<const TrackFile*>> songs;
    for (const auto& file : files) {
        songs[songIdentifier(file.filename)].push_back(&file);
    }

    std::vector<TrackFile> result;
    result.reserve(songs.size());

    for (const auto& [song, candidates] : songs) {
        const TrackFile* best = candidates.front();
        int bestRank = formatRank(best->format, formatPreferences);
        int bestScore = qualityScore(best->format);

        for (size_t i = 1; i < candidates.size(); ++i) {
            int rank = formatRank(candidates[i]->format, formatPreferences);
            int score = qualityScore(candidates[i]->format);
            if (rank < bestRank || (rank == bestRank && score > bestScore)) {
                best = candidates[i];
                bestRank = rank;
                bestScore = score;
            }
        }

        Logger::instance().debug("Song '{}': selected {} from {} options", song, best->format, candidates.size());
        result.push_back(*best);
    }

    std::sort(result.begin(), result.end(),
              [](const TrackFile& a, const TrackFile& b) { return a.filename < b.filename; });
    return result;
}

// -- JsonManifestResolver --

JsonManifestResolver::JsonManifestResolver(std::filesystem::path manifestDir)
    : m_manifestDir(std::move(manifestDir)) {
}

void JsonManifestResolver::registerManifest(const std::string& recordingId, const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_registered[recordingId] = path;
}

std::vector<TrackFile> JsonManifestResolver::parseManifest(const json& manifest) {
    std::string baseUrl = manifest.value("baseUrl", "");
    while (!baseUrl.empty() && baseUrl.back() == '/') {
        baseUrl.pop_back();
    }

    std::vector<TrackFile> files;
    for (const auto& item : manifest.at("files")) {
        TrackFile file;
        file.filename = item.at("filename").get<std::string>();
        file.format = item.value("format", "");
        file.sizeBytes = item.value("size", uint64_t(0));
        file.url = item.value("url", "");
        file.sha1 = item.value("sha1", "");

        if (file.url.empty() && !baseUrl.empty()) {
            file.url = baseUrl + "/" + file.filename;
        }
        if (file.url.empty()) {
            throw std::invalid_argument("file '" + file.filename + "' has no url");
        }
        files.push_back(std::move(file));
    }
    return files;
}

std::optional<std::vector<TrackFile>> JsonManifestResolver::resolve(const std::string& recordingId) {
    std::filesystem::path path;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_registered.find(recordingId);
        if (it != m_registered.end()) {
            path = it->second;
        } else if (!m_manifestDir.empty()) {
            path = m_manifestDir / (StringUtils::sanitizeFileName(recordingId) + ".json");
        }
    }

    if (path.empty()) {
        Logger::instance().warn("No manifest for recording {}", recordingId);
        return std::nullopt;
    }

    auto content = utils::FileUtils::readFile(path);
    if (!content) {
        Logger::instance().warn("Cannot read manifest {} for {}", path.string(), recordingId);
        return std::nullopt;
    }

    try {
        return parseManifest(json::parse(*content));
    } catch (const std::exception& e) {
        Logger::instance().error("Invalid manifest {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

} // namespace tapedeck::core::downloader
