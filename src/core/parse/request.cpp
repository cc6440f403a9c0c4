#include "request.hpp"

#include <set>
#include <vector>

#include "../../utils/utils.hpp"

namespace core::parse {
namespace {
const std::vector<std::string> SchemesWithParams = {
    "",     "ftp",  "hdl",   "prospero", "http",  "imap",
    "https", "shttp", "rtsp", "rtsps",   "rtspu", "sip",
    "sips", "mms",  "sftp",  "tel",
};

bool IsSchemeChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           utils::IsAsciiDigit(c) || c == '+' || c == '-' || c == '.';
}

bool IsAsciiAlpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}
}  // namespace

Request SplitRequest(std::string_view request) {
    Request res{};
    auto parts = utils::SplitWhitespace(request);
    if (parts.size() > 0) res.method = parts[0];
    if (parts.size() > 1) res.uri = parts[1];
    if (parts.size() > 2) res.proto = parts[2];

    res.path = res.uri;
    if (res.uri.find("://") != std::string::npos) {
        auto url = ParseUrl(res.uri);
        res.path = url.path;
        res.query = url.query;
    } else if (auto pos = res.uri.find('?'); pos != std::string::npos) {
        res.path = res.uri.substr(0, pos);
        res.query = res.uri.substr(pos + 1);
    }

    return res;
}

UrlParts ParseUrl(std::string_view url) {
    UrlParts res{};

    auto colon = url.find(':');
    if (colon != std::string_view::npos && colon > 0 &&
        IsAsciiAlpha(url.front())) {
        bool valid = true;
        for (char c : url.substr(0, colon)) {
            if (!IsSchemeChar(c)) {
                valid = false;
                break;
            }
        }
        if (valid) {
            res.scheme = utils::ToLower(url.substr(0, colon));
            url.remove_prefix(colon + 1);
        }
    }

    if (url.substr(0, 2) == "//") {
        auto end = url.find_first_of("/?#", 2);
        if (end == std::string_view::npos) end = url.size();
        res.netloc = std::string(url.substr(2, end - 2));
        url.remove_prefix(end);
    }

    if (auto hash = url.find('#'); hash != std::string_view::npos) {
        res.fragment = std::string(url.substr(hash + 1));
        url = url.substr(0, hash);
    }

    if (auto question = url.find('?'); question != std::string_view::npos) {
        res.query = std::string(url.substr(question + 1));
        url = url.substr(0, question);
    }

    if (utils::contains(SchemesWithParams, res.scheme) &&
        url.find(';') != std::string_view::npos) {
        usize semicolon = std::string_view::npos;
        if (auto slash = url.rfind('/'); slash != std::string_view::npos) {
            semicolon = url.find(';', slash);
        } else {
            semicolon = url.find(';');
        }
        if (semicolon != std::string_view::npos) {
            res.params = std::string(url.substr(semicolon + 1));
            url = url.substr(0, semicolon);
        }
    }

    res.path = std::string(url);
    return res;
}

u64 CountQueryKeys(std::string_view query) {
    std::set<std::string> names;

    usize start = 0;
    while (start <= query.size()) {
        auto end = query.find('&', start);
        if (end == std::string_view::npos) end = query.size();
        auto pair = query.substr(start, end - start);
        start = end + 1;

        auto eq = pair.find('=');
        if (eq == std::string_view::npos || eq + 1 == pair.size()) {
            continue;
        }

        std::string name(pair.substr(0, eq));
        for (auto &c : name) {
            if (c == '+') c = ' ';
        }
        names.insert(utils::SanitizeUtf8(utils::PercentDecode(name)));
    }

    return names.size();
}
}  // namespace core::parse
