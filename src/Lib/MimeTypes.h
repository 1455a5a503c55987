//
// Filename to content type lookup used when framing downloads and notifying the metadata store
//

#ifndef TELESTORE_RELAY_MIMETYPES_H
#define TELESTORE_RELAY_MIMETYPES_H

#include <string>

// Returns the content type for the extension of fileName, or application/octet-stream when unknown
auto getMimeType(const std::string& fileName) -> std::string;

#endif //TELESTORE_RELAY_MIMETYPES_H
