#include "resolver.hpp"

#include <spdlog/spdlog.h>

#include <system_error>
#include <utility>
#include <vector>

namespace {
int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

const char *ExistsText(bool exists) {
    return exists ? "True" : "False";
}
} // namespace

// ─────────────────────────────────────
PathResolver::PathResolver(std::filesystem::path root) : m_Root(std::move(root)) {}

// ─────────────────────────────────────
std::string PathResolver::StripQueryAndFragment(const std::string &target) {
    std::string path = target.substr(0, target.find('?'));
    return path.substr(0, path.find('#'));
}

// ─────────────────────────────────────
std::string PathResolver::PercentDecode(const std::string &in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            const int hi = HexValue(in[i + 1]);
            const int lo = HexValue(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(in[i]);
    }
    return out;
}

// ─────────────────────────────────────
bool PathResolver::TranslatePath(const std::string &request_path,
                                 std::filesystem::path &out) const {
    if (request_path.find('\0') != std::string::npos) {
        return false;
    }

    // "." is dropped, ".." pops the previous segment and never climbs above the root
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= request_path.size()) {
        size_t end = request_path.find('/', start);
        if (end == std::string::npos) {
            end = request_path.size();
        }
        std::string word = request_path.substr(start, end - start);
        start = end + 1;

        if (word.empty() || word == ".") {
            continue;
        }
        if (word == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
            continue;
        }
        segments.push_back(std::move(word));
    }

    std::filesystem::path fs_path = m_Root;
    for (const auto &word : segments) {
        fs_path /= word;
    }
    if (!request_path.empty() && request_path.back() == '/') {
        fs_path /= "";
    }

    out = std::move(fs_path);
    return true;
}

// ─────────────────────────────────────
PathResolver::Probe PathResolver::ProbePath(const std::filesystem::path &p,
                                            std::string &error) const {
    std::error_code ec;
    const std::filesystem::file_status st = std::filesystem::status(p, ec);

    // ENOENT and ENOTDIR both come back as not_found
    if (st.type() == std::filesystem::file_type::not_found) {
        return PROBE_MISSING;
    }
    if (ec) {
        error = ec.message();
        return PROBE_ERROR;
    }
    if (std::filesystem::is_regular_file(st)) {
        return PROBE_FILE;
    }
    if (std::filesystem::is_directory(st)) {
        return PROBE_DIRECTORY;
    }
    return PROBE_OTHER;
}

// ─────────────────────────────────────
Resolution PathResolver::Resolve(const std::string &target) const {
    Resolution out;
    out.request_path = PercentDecode(StripQueryAndFragment(target));

    std::filesystem::path fs_path;
    if (!TranslatePath(out.request_path, fs_path)) {
        spdlog::debug("Requested: {} -> FS: <invalid> -> Exists: False", target);
        ResolveFallback(out);
        return out;
    }

    std::string error;
    const Probe probe = ProbePath(fs_path, error);
    spdlog::debug("Requested: {} -> FS: {} -> Exists: {}", out.request_path, fs_path.string(),
                  ExistsText(probe != PROBE_MISSING && probe != PROBE_ERROR));

    if (probe == PROBE_ERROR) {
        out.mode = DIRECT_FILE;
        out.status = RESOLVE_IO_ERROR;
        out.effective_path = out.request_path;
        out.file = fs_path;
        out.error = error;
        spdlog::warn("Cannot access {}: {}", fs_path.string(), error);
        return out;
    }

    if (probe == PROBE_FILE) {
        out.mode = DIRECT_FILE;
        out.effective_path = out.request_path;
        out.file = fs_path;
        spdlog::debug("Serving file directly: {}", fs_path.string());
        return out;
    }

    if (probe == PROBE_DIRECTORY) {
        const std::filesystem::path index_path = fs_path / SPASERVE_INDEX_DOCUMENT;
        const Probe index_probe = ProbePath(index_path, error);
        spdlog::debug("Directory: {} -> Index: {} -> Exists: {}", fs_path.string(),
                      index_path.string(), ExistsText(index_probe == PROBE_FILE));

        if (index_probe == PROBE_ERROR) {
            out.mode = DIRECTORY_INDEX;
            out.status = RESOLVE_IO_ERROR;
            out.effective_path = out.request_path;
            out.file = index_path;
            out.error = error;
            spdlog::warn("Cannot access {}: {}", index_path.string(), error);
            return out;
        }

        if (index_probe == PROBE_FILE) {
            std::string rewritten = out.request_path;
            if (rewritten.empty() || rewritten.back() != '/') {
                rewritten += "/";
            }
            out.mode = DIRECTORY_INDEX;
            out.effective_path = rewritten + SPASERVE_INDEX_DOCUMENT;
            out.file = index_path;
            spdlog::debug("Serving directory index: {}", index_path.string());
            return out;
        }
    }

    ResolveFallback(out);
    return out;
}

// ─────────────────────────────────────
void PathResolver::ResolveFallback(Resolution &out) const {
    out.mode = FALLBACK;
    out.effective_path = std::string("/") + SPASERVE_INDEX_DOCUMENT;
    out.file = m_Root / SPASERVE_INDEX_DOCUMENT;

    std::string error;
    const Probe probe = ProbePath(out.file, error);
    if (probe == PROBE_FILE) {
        out.status = RESOLVE_OK;
        spdlog::debug("Falling back to {}", out.file.string());
        return;
    }

    if (probe == PROBE_ERROR) {
        out.status = RESOLVE_IO_ERROR;
        out.error = error;
        spdlog::warn("Cannot access fallback document {}: {}", out.file.string(), error);
        return;
    }

    out.status = RESOLVE_NOT_FOUND;
    out.error = "fallback document not found";
    spdlog::debug("Fallback document missing: {}", out.file.string());
}
