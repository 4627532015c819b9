#include "SegmentPlanner.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace {
std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (!line.empty())
            lines.push_back(line);
    }
    return lines;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool hasScheme(const std::string& ref) {
    auto colon = ref.find("://");
    if (colon == std::string::npos || colon == 0)
        return false;

    return std::all_of(ref.begin(), ref.begin() + colon, [](unsigned char ch) {
        return std::isalnum(ch) || ch == '+' || ch == '-' || ch == '.';
        });
}

// Value of KEY=... inside an attribute list; quoted values are unquoted.
std::string attribute(const std::string& attrs, const std::string& key) {
    std::size_t pos = 0;
    while (pos < attrs.size()) {
        auto eq = attrs.find('=', pos);
        if (eq == std::string::npos)
            return {};

        std::string name = trim(attrs.substr(pos, eq - pos));
        std::size_t valueStart = eq + 1;
        std::size_t valueEnd;
        std::string value;

        if (valueStart < attrs.size() && attrs[valueStart] == '"') {
            valueEnd = attrs.find('"', valueStart + 1);
            if (valueEnd == std::string::npos)
                valueEnd = attrs.size();
            value = attrs.substr(valueStart + 1, valueEnd - valueStart - 1);
            valueEnd = attrs.find(',', valueEnd);
        }
        else {
            valueEnd = attrs.find(',', valueStart);
            value = attrs.substr(valueStart, valueEnd == std::string::npos ? std::string::npos : valueEnd - valueStart);
        }

        if (name == key)
            return trim(value);

        if (valueEnd == std::string::npos)
            return {};
        pos = valueEnd + 1;
    }
    return {};
}

std::string makeLabel(std::uint64_t bandwidth, const std::string& resolution) {
    std::ostringstream os;
    const double mbps = static_cast<double>(bandwidth) / 1'000'000.0;

    auto x = resolution.find('x');
    if (!resolution.empty() && x != std::string::npos) {
        os << resolution << " (" << resolution.substr(x + 1) << "p) - "
            << std::fixed << std::setprecision(1) << mbps << " Mbps";
    }
    else {
        os << std::fixed << std::setprecision(1) << mbps << "M";
    }
    return os.str();
}
}

std::string SegmentPlanner::manifestHost(const std::string& manifestUrl) {
    auto scheme = manifestUrl.find("://");
    if (scheme == std::string::npos)
        return {};

    auto pathStart = manifestUrl.find_first_of("/?#", scheme + 3);
    return manifestUrl.substr(0, pathStart);
}

std::string SegmentPlanner::manifestDirectory(const std::string& manifestUrl) {
    const std::string host = manifestHost(manifestUrl);

    std::string path = manifestUrl.substr(host.size());
    auto special = path.find_first_of("?#");
    if (special != std::string::npos)
        path = path.substr(0, special);

    auto slash = path.find_last_of('/');
    if (slash == std::string::npos)
        return host.empty() ? std::string() : host;

    return host + path.substr(0, slash);
}

std::string SegmentPlanner::resolveUrl(const std::string& manifestUrl, const std::string& ref) {
    if (hasScheme(ref))
        return ref;

    if (startsWith(ref, "//")) {
        auto scheme = manifestUrl.find("://");
        return (scheme == std::string::npos ? std::string("https") : manifestUrl.substr(0, scheme)) + ":" + ref;
    }

    if (startsWith(ref, "/"))
        return manifestHost(manifestUrl) + ref;

    return manifestDirectory(manifestUrl) + "/" + ref;
}

StreamDescriptor SegmentPlanner::describe(const std::string& manifestUrl) {
    return { manifestUrl, manifestDirectory(manifestUrl) };
}

bool SegmentPlanner::isMasterPlaylist(const std::string& manifestText) {
    return manifestText.find("#EXT-X-STREAM-INF") != std::string::npos;
}

bool SegmentPlanner::plan(const std::string& manifestText,
    const std::string& manifestUrl,
    std::vector<SegmentDescriptor>& out,
    std::string& error) {
    out.clear();

    if (isMasterPlaylist(manifestText)) {
        error = "manifest is a master playlist; select a variant first";
        return false;
    }

    std::uint64_t index = 0;
    for (const auto& line : splitLines(manifestText)) {
        if (line[0] == '#')
            continue;

        out.push_back({ index++, line, resolveUrl(manifestUrl, line) });
    }

    if (out.empty()) {
        error = "no segments found in manifest " + manifestUrl;
        return false;
    }

    return true;
}

bool SegmentPlanner::listVariants(const std::string& manifestText,
    const std::string& manifestUrl,
    std::vector<StreamVariant>& out,
    std::string& error) {
    out.clear();

    if (!isMasterPlaylist(manifestText)) {
        // Single-quality stream: the manifest itself is the only variant.
        out.push_back({ manifestUrl, 0, {}, "Default quality" });
        return true;
    }

    const auto lines = splitLines(manifestText);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (!startsWith(lines[i], "#EXT-X-STREAM-INF:"))
            continue;

        const std::string attrs = lines[i].substr(std::string("#EXT-X-STREAM-INF:").size());

        std::size_t uriLine = i + 1;
        while (uriLine < lines.size() && lines[uriLine][0] == '#')
            ++uriLine;
        if (uriLine >= lines.size())
            break;

        StreamVariant v{};
        v.url = resolveUrl(manifestUrl, lines[uriLine]);
        v.resolution = attribute(attrs, "RESOLUTION");

        const std::string bw = attribute(attrs, "BANDWIDTH");
        v.bandwidth = 0;
        if (!bw.empty() && bw.size() < 20 && std::all_of(bw.begin(), bw.end(), [](unsigned char ch) { return std::isdigit(ch); }))
            v.bandwidth = std::stoull(bw);

        v.label = makeLabel(v.bandwidth, v.resolution);
        out.push_back(v);
        i = uriLine;
    }

    if (out.empty()) {
        error = "master playlist " + manifestUrl + " lists no variants";
        return false;
    }

    std::stable_sort(out.begin(), out.end(), [](const StreamVariant& a, const StreamVariant& b) {
        return a.bandwidth > b.bandwidth;
        });

    return true;
}
