#include "multipart.hpp"
#include <algorithm>
#include <cctype>

namespace mockup::http_service {

namespace {

std::string toLower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::string unquote(std::string_view s)
{
    s = trim(s);
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"')
        s = s.substr(1, s.size() - 2);
    return std::string(s);
}

// key=value parameters after the first ';' of a header value
std::optional<std::string> headerParam(std::string_view value, std::string_view key)
{
    std::size_t pos = value.find(';');
    while (pos != std::string_view::npos)
    {
        std::size_t next = value.find(';', pos + 1);
        // a ';' inside a quoted value does not end the parameter
        std::size_t quote = value.find('"', pos + 1);
        if (quote != std::string_view::npos && next != std::string_view::npos && quote < next)
        {
            std::size_t close = value.find('"', quote + 1);
            if (close != std::string_view::npos) next = value.find(';', close + 1);
        }
        std::string_view param = value.substr(pos + 1, next == std::string_view::npos ? std::string_view::npos : next - pos - 1);
        std::size_t eq = param.find('=');
        if (eq != std::string_view::npos && toLower(trim(param.substr(0, eq))) == toLower(key))
            return unquote(param.substr(eq + 1));
        pos = next;
    }
    return std::nullopt;
}

void parseHeaders(std::string_view block, FormPart& part)
{
    std::size_t start = 0;
    while (start < block.size())
    {
        std::size_t end = block.find("\r\n", start);
        std::string_view line = block.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
        std::size_t colon = line.find(':');
        if (colon != std::string_view::npos)
        {
            std::string name = toLower(trim(line.substr(0, colon)));
            std::string_view value = trim(line.substr(colon + 1));
            if (name == "content-disposition")
            {
                if (auto n = headerParam(value, "name")) part.name = *n;
                part.filename = headerParam(value, "filename");
            }
            else if (name == "content-type")
            {
                part.contentType = std::string(value);
            }
        }
        if (end == std::string_view::npos) break;
        start = end + 2;
    }
}

}

std::optional<std::string> boundaryFromContentType(std::string_view contentType)
{
    std::string_view type = trim(contentType.substr(0, contentType.find(';')));
    if (toLower(type) != "multipart/form-data") return std::nullopt;
    auto boundary = headerParam(contentType, "boundary");
    if (!boundary || boundary->empty()) return std::nullopt;
    return boundary;
}

std::vector<FormPart> parseMultipart(std::string_view body, std::string_view boundary)
{
    std::vector<FormPart> parts;
    const std::string delimiter = "--" + std::string(boundary);
    const std::string separator = "\r\n" + delimiter;

    std::size_t pos = body.find(delimiter);
    if (pos == std::string_view::npos) return parts;
    pos += delimiter.size();

    while (pos + 2 <= body.size())
    {
        if (body.compare(pos, 2, "--") == 0) break; // closing delimiter
        if (body.compare(pos, 2, "\r\n") != 0) break;
        pos += 2;

        std::size_t headersEnd = body.find("\r\n\r\n", pos);
        if (headersEnd == std::string_view::npos) break;
        std::size_t dataStart = headersEnd + 4;
        std::size_t dataEnd = body.find(separator, dataStart);
        if (dataEnd == std::string_view::npos) break;

        FormPart part;
        parseHeaders(body.substr(pos, headersEnd - pos), part);
        part.body = std::string(body.substr(dataStart, dataEnd - dataStart));
        parts.push_back(std::move(part));

        pos = dataEnd + separator.size();
    }
    return parts;
}

const FormPart* findPart(const std::vector<FormPart>& parts, std::string_view name)
{
    auto it = std::find_if(parts.begin(), parts.end(), [&](const FormPart& p) { return p.name == name; });
    return it == parts.end() ? nullptr : &*it;
}

}
