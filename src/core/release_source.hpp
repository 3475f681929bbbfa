#pragma once

#include <string>

/// Where release tags and assets come from
class ReleaseSource {
public:
    virtual ~ReleaseSource() = default;

    /// Newest release tag of `repo` ("owner/name"); empty on any failure
    virtual std::string latest_tag(const std::string& repo) = 0;

    /// Download `url` to `dest_path`. Partial files are removed on failure.
    virtual bool download(const std::string& url, const std::string& dest_path) = 0;

    /// Map `uname -m` to an asset name: x86_64 -> <prefix>-amd64,
    /// aarch64/arm64 -> <prefix>-arm64. Empty for anything else.
    static std::string asset_for_machine(const std::string& prefix, const std::string& machine);

    /// <base>/<repo>/releases/download/<tag>/<asset>
    static std::string download_url(const std::string& download_base,
                                     const std::string& repo,
                                     const std::string& tag,
                                     const std::string& asset);
};

/// GitHub REST API over cpp-httplib
class GithubReleaseSource : public ReleaseSource {
public:
    explicit GithubReleaseSource(const std::string& api_base = "https://api.github.com");

    std::string latest_tag(const std::string& repo) override;
    bool download(const std::string& url, const std::string& dest_path) override;

    /// Extract "tag_name" from a releases/latest JSON body; empty if absent
    static std::string parse_tag_name(const std::string& body);

    struct UrlParts {
        std::string scheme;
        std::string host;
        int port = 443;
        std::string path;
    };
    static UrlParts parse_url(const std::string& url);

private:
    std::string api_base_;
};
