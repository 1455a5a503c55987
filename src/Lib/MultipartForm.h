//
// multipart/form-data encoding and decoding
//

#ifndef TELESTORE_RELAY_MULTIPARTFORM_H
#define TELESTORE_RELAY_MULTIPARTFORM_H

#include <map>
#include <string>

struct sFormField {
    std::string name;
    std::string fileName;
    std::string contentType;
    std::string value;
    bool isFile = false;
};

using FormFields = std::map<std::string, sFormField>;

// Parses a multipart/form-data body. Throws eBadRequest if the content type carries no boundary or the body is
// malformed. When a field name repeats, the last part wins.
auto parseMultipartForm(const std::string& contentType, const std::string& body) -> FormFields;

class MultipartBuilder {
public:
    MultipartBuilder();

    void addField(const std::string& name, const std::string& value);
    void addFile(const std::string& name, const std::string& fileName, const std::string& contentType, const std::string& data);

    // Closes the body, no more parts may be added afterwards
    auto finish() -> std::string;

    [[nodiscard]] auto getContentType() const -> std::string;

private:
    std::string boundary;
    std::string body;
};

#endif //TELESTORE_RELAY_MULTIPARTFORM_H
