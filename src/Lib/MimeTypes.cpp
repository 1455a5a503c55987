#include "MimeTypes.h"
#include "../Settings.h"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/filesystem.hpp>
#include <unordered_map>

namespace {
// NOLINTNEXTLINE(cert-err58-cpp)
const std::unordered_map<std::string, std::string> mimeTypes = {
        // Documents
        {".pdf", "application/pdf"},
        {".txt", "text/plain"},
        {".csv", "text/csv"},
        {".htm", "text/html"},
        {".html", "text/html"},
        {".css", "text/css"},
        {".js", "text/javascript"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".md", "text/markdown"},
        {".rtf", "application/rtf"},
        {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".xls", "application/vnd.ms-excel"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".ppt", "application/vnd.ms-powerpoint"},
        {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {".epub", "application/epub+zip"},

        // Images
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".png", "image/png"},
        {".gif", "image/gif"},
        {".bmp", "image/bmp"},
        {".webp", "image/webp"},
        {".svg", "image/svg+xml"},
        {".ico", "image/vnd.microsoft.icon"},
        {".tif", "image/tiff"},
        {".tiff", "image/tiff"},
        {".heic", "image/heic"},

        // Audio
        {".mp3", "audio/mpeg"},
        {".wav", "audio/x-wav"},
        {".ogg", "audio/ogg"},
        {".flac", "audio/flac"},
        {".m4a", "audio/mp4"},
        {".aac", "audio/aac"},

        // Video
        {".mp4", "video/mp4"},
        {".m4v", "video/mp4"},
        {".mkv", "video/x-matroska"},
        {".webm", "video/webm"},
        {".mov", "video/quicktime"},
        {".avi", "video/x-msvideo"},
        {".mpeg", "video/mpeg"},
        {".mpg", "video/mpeg"},

        // Archives
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".7z", "application/x-7z-compressed"},
        {".rar", "application/vnd.rar"},
        {".apk", "application/vnd.android.package-archive"},
};
} // namespace

auto getMimeType(const std::string& fileName) -> std::string
{
    auto extension = boost::algorithm::to_lower_copy(boost::filesystem::path(fileName).extension().string());

    auto mimeType = mimeTypes.find(extension);
    if (mimeType == mimeTypes.end())
    {
        return DEFAULT_CONTENT_TYPE;
    }

    return mimeType->second;
}
