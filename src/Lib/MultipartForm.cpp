#include "MultipartForm.h"
#include "Errors.h"
#include "GeneralUtils.h"
#include <boost/algorithm/string.hpp>
#include <sstream>
#include <utility.hpp>
#include <vector>

namespace {
const std::string CRLF = "\r\n";
const std::string HEADER_END = "\r\n\r\n";

// Splits a header value of the form 'token; key=value; key="value"' into its attributes, the leading token is stored
// with an empty value
auto parseAttributes(const std::string& headerValue) -> SimpleWeb::CaseInsensitiveMultimap
{
    SimpleWeb::CaseInsensitiveMultimap result;

    std::vector<std::string> parts;
    boost::algorithm::split(parts, headerValue, boost::algorithm::is_any_of(";"));

    for (auto& part : parts)
    {
        boost::algorithm::trim(part);
        if (part.empty())
        {
            continue;
        }

        auto equals = part.find('=');
        if (equals == std::string::npos)
        {
            result.emplace(part, "");
            continue;
        }

        auto key = boost::algorithm::trim_copy(part.substr(0, equals));
        auto value = boost::algorithm::trim_copy(part.substr(equals + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
        {
            value = value.substr(1, value.size() - 2);
        }

        result.emplace(key, value);
    }

    return result;
}

auto getAttribute(const SimpleWeb::CaseInsensitiveMultimap& attributes, const std::string& key) -> std::string
{
    auto attribute = attributes.find(key);
    return attribute == attributes.end() ? std::string() : attribute->second;
}
} // namespace

auto parseMultipartForm(const std::string& contentType, const std::string& body) -> FormFields
{
    auto contentAttributes = parseAttributes(contentType);
    if (contentAttributes.find("multipart/form-data") == contentAttributes.end())
    {
        throw eBadRequest("Expected a multipart/form-data body");
    }

    auto boundary = getAttribute(contentAttributes, "boundary");
    if (boundary.empty())
    {
        throw eBadRequest("multipart/form-data body has no boundary");
    }

    const auto delimiter = "--" + boundary;
    const auto partEnd = CRLF + delimiter;

    FormFields fields;

    auto position = body.find(delimiter);
    if (position == std::string::npos)
    {
        throw eBadRequest("multipart/form-data body does not contain its boundary");
    }
    position += delimiter.size();

    while (true)
    {
        // The closing delimiter is followed by "--"
        if (body.compare(position, 2, "--") == 0)
        {
            break;
        }

        if (body.compare(position, CRLF.size(), CRLF) != 0)
        {
            throw eBadRequest("Malformed multipart/form-data delimiter");
        }
        position += CRLF.size();

        auto headersEnd = body.find(HEADER_END, position);
        if (headersEnd == std::string::npos)
        {
            throw eBadRequest("Unterminated multipart/form-data part headers");
        }

        // HttpHeader::parse stops at the first line without a ':' so the blank line terminates it
        std::istringstream headerStream(body.substr(position, headersEnd - position + HEADER_END.size()));
        auto headers = SimpleWeb::HttpHeader::parse(headerStream);

        auto dataStart = headersEnd + HEADER_END.size();
        auto dataEnd = body.find(partEnd, dataStart);
        if (dataEnd == std::string::npos)
        {
            throw eBadRequest("Unterminated multipart/form-data part");
        }

        auto disposition = headers.find("Content-Disposition");
        if (disposition != headers.end())
        {
            auto attributes = parseAttributes(disposition->second);

            sFormField field;
            field.name = getAttribute(attributes, "name");
            field.isFile = attributes.find("filename") != attributes.end();
            field.fileName = getAttribute(attributes, "filename");

            auto partType = headers.find("Content-Type");
            field.contentType = partType == headers.end() ? std::string() : partType->second;
            field.value = body.substr(dataStart, dataEnd - dataStart);

            if (!field.name.empty())
            {
                fields[field.name] = std::move(field);
            }
        }

        position = dataEnd + partEnd.size();
    }

    return fields;
}

MultipartBuilder::MultipartBuilder() : boundary("----TeleStoreRelayBoundary" + generateUUID())
{
}

void MultipartBuilder::addField(const std::string& name, const std::string& value)
{
    body += "--" + boundary + CRLF;
    body += "Content-Disposition: form-data; name=\"" + name + "\"" + CRLF + CRLF;
    body += value + CRLF;
}

void MultipartBuilder::addFile(
        const std::string& name,
        const std::string& fileName,
        const std::string& contentType,
        const std::string& data
)
{
    body += "--" + boundary + CRLF;
    body += "Content-Disposition: form-data; name=\"" + name + "\"; filename=\"" + fileName + "\"" + CRLF;
    body += "Content-Type: " + contentType + CRLF + CRLF;
    body += data + CRLF;
}

auto MultipartBuilder::finish() -> std::string
{
    body += "--" + boundary + "--" + CRLF;
    return std::move(body);
}

auto MultipartBuilder::getContentType() const -> std::string
{
    return "multipart/form-data; boundary=" + boundary;
}
