#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mockup::http_service {

// One part of a multipart/form-data body.
struct FormPart
{
    std::string name;
    std::optional<std::string> filename; // set only when the part is a file field
    std::string contentType;
    std::string body;
};

// Boundary parameter of a multipart/form-data Content-Type, if any.
std::optional<std::string> boundaryFromContentType(std::string_view contentType);

// Splits `body` on `boundary`. Malformed trailing data is ignored; parts parsed
// before it are kept.
std::vector<FormPart> parseMultipart(std::string_view body, std::string_view boundary);

// First part named `name`, or nullptr.
const FormPart* findPart(const std::vector<FormPart>& parts, std::string_view name);

}
