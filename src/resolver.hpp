#pragma once

#include <filesystem>
#include <string>

#include "common.hpp"

#define SPASERVE_INDEX_DOCUMENT "index.html"

struct Resolution {
    ResponseMode mode = FALLBACK;
    ResolveStatus status = RESOLVE_OK;
    std::string request_path;   // decoded, without query and fragment
    std::string effective_path; // path after the directory-index or fallback rewrite
    std::filesystem::path file; // file to serve when status == RESOLVE_OK
    std::string error;
};

class PathResolver {
  public:
    explicit PathResolver(std::filesystem::path root);

    // Maps a raw request target ("/a/b?x#y") to exactly one response mode.
    // Filesystem failures are reported in Resolution::status, never thrown.
    Resolution Resolve(const std::string &target) const;

    // Target -> filesystem path under the root. Returns false when the decoded
    // path cannot name a file (embedded NUL).
    bool TranslatePath(const std::string &request_path, std::filesystem::path &out) const;

    static std::string StripQueryAndFragment(const std::string &target);
    static std::string PercentDecode(const std::string &in);

    const std::filesystem::path &GetRoot() const {
        return m_Root;
    }

  private:
    enum Probe { PROBE_MISSING, PROBE_FILE, PROBE_DIRECTORY, PROBE_OTHER, PROBE_ERROR };

    Probe ProbePath(const std::filesystem::path &p, std::string &error) const;
    void ResolveFallback(Resolution &out) const;

  private:
    std::filesystem::path m_Root;
};
