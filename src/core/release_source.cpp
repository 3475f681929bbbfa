#include "core/release_source.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <memory>

#ifndef PHANTOM_MANAGER_VERSION
#define PHANTOM_MANAGER_VERSION "0.0.0"
#endif

namespace fs = std::filesystem;
using json = nlohmann::json;

static const char* kUserAgent = "phantom-manager/" PHANTOM_MANAGER_VERSION;

// ════════════════════════════════════════════════════════════════
// Asset naming
// ════════════════════════════════════════════════════════════════

std::string ReleaseSource::asset_for_machine(const std::string& prefix, const std::string& machine) {
    if (machine == "x86_64") {
        return prefix + "-amd64";
    }
    if (machine == "aarch64" || machine == "arm64") {
        return prefix + "-arm64";
    }
    return "";
}

std::string ReleaseSource::download_url(const std::string& download_base,
                                        const std::string& repo,
                                        const std::string& tag,
                                        const std::string& asset) {
    std::string base = download_base;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/" + repo + "/releases/download/" + tag + "/" + asset;
}

// ════════════════════════════════════════════════════════════════
// GitHub
// ════════════════════════════════════════════════════════════════

GithubReleaseSource::GithubReleaseSource(const std::string& api_base) : api_base_(api_base) {}

GithubReleaseSource::UrlParts GithubReleaseSource::parse_url(const std::string& url) {
    UrlParts parts;
    auto pos = url.find("://");
    if (pos == std::string::npos) {
        return parts;
    }
    parts.scheme = url.substr(0, pos);
    auto rest = url.substr(pos + 3);
    auto path_pos = rest.find('/');
    if (path_pos != std::string::npos) {
        parts.host = rest.substr(0, path_pos);
        parts.path = rest.substr(path_pos);
    } else {
        parts.host = rest;
        parts.path = "/";
    }

    auto colon = parts.host.find(':');
    if (colon != std::string::npos) {
        std::string port = parts.host.substr(colon + 1);
        parts.host = parts.host.substr(0, colon);
        if (port.empty() || port.size() > 5 ||
            port.find_first_not_of("0123456789") != std::string::npos) {
            parts.host.clear();  // unusable
            return parts;
        }
        parts.port = std::stoi(port);
    } else {
        parts.port = (parts.scheme == "https") ? 443 : 80;
    }
    return parts;
}

static std::unique_ptr<httplib::Client> make_client(const GithubReleaseSource::UrlParts& parts) {
    std::string origin = parts.scheme + "://" + parts.host + ":" + std::to_string(parts.port);
    auto cli = std::make_unique<httplib::Client>(origin);
    cli->set_connection_timeout(15, 0);
    cli->set_read_timeout(120, 0);
    cli->set_follow_location(true);
    return cli;
}

std::string GithubReleaseSource::parse_tag_name(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.is_object()) return "";
        auto it = j.find("tag_name");
        if (it == j.end() || !it->is_string()) return "";
        return it->get<std::string>();
    } catch (const json::exception& e) {
        spdlog::warn("Release listing is not valid JSON: {}", e.what());
        return "";
    }
}

std::string GithubReleaseSource::latest_tag(const std::string& repo) {
    auto parts = parse_url(api_base_);
    if (parts.host.empty()) {
        spdlog::error("Invalid API base URL: {}", api_base_);
        return "";
    }

    std::string prefix = parts.path == "/" ? "" : parts.path;
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    std::string path = prefix + "/repos/" + repo + "/releases/latest";

    httplib::Headers headers = {
        {"User-Agent", kUserAgent},
        {"Accept", "application/vnd.github.v3+json"},
    };

    auto cli = make_client(parts);
    auto res = cli->Get(path, headers);
    if (!res) {
        spdlog::error("GET {}{} failed: {}", api_base_, path, httplib::to_string(res.error()));
        return "";
    }
    if (res->status != 200) {
        spdlog::error("GET {}{} returned HTTP {}", api_base_, path, res->status);
        return "";
    }

    std::string tag = parse_tag_name(res->body);
    spdlog::info("Latest release of {}: '{}'", repo, tag);
    return tag;
}

bool GithubReleaseSource::download(const std::string& url, const std::string& dest_path) {
    auto parts = parse_url(url);
    if (parts.host.empty()) {
        spdlog::error("Invalid download URL: {}", url);
        return false;
    }

    std::error_code ec;
    auto parent = fs::path(dest_path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            spdlog::error("Cannot create {}: {}", parent.string(), ec.message());
            return false;
        }
    }

    bool written = true;
    int status = 0;
    {
        std::ofstream out(dest_path, std::ios::binary);
        if (!out.is_open()) {
            spdlog::error("Cannot open {} for writing", dest_path);
            return false;
        }

        httplib::Headers headers = {
            {"User-Agent", kUserAgent},
        };

        // Redirect hops never reach these handlers
        auto response_handler = [&](const httplib::Response& response) {
            status = response.status;
            return response.status == 200;
        };
        auto content_receiver = [&](const char* data, size_t data_length) {
            out.write(data, static_cast<std::streamsize>(data_length));
            if (!out.good()) {
                written = false;
                return false;
            }
            return true;
        };

        auto cli = make_client(parts);
        auto res = cli->Get(parts.path, headers, response_handler, content_receiver);
        if (!res) {
            spdlog::error("Download of {} failed: {} (HTTP {})", url,
                          httplib::to_string(res.error()), status);
            written = false;
        } else if (res->status != 200) {
            spdlog::error("Download of {} returned HTTP {}", url, res->status);
            written = false;
        }
    }

    if (!written) {
        fs::remove(dest_path, ec);
        return false;
    }
    spdlog::info("Downloaded {} to {}", url, dest_path);
    return true;
}
