#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Raised when a document or archive cannot be read or has an
 * unsupported internal structure. Fails only the owning document.
 */
class DocumentError : public std::runtime_error
{
public:
    explicit DocumentError(const std::string &message) : std::runtime_error(message) {}
};
