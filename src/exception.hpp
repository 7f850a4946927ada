#pragma once

#include <stdexcept>
#include <string>

class HpiError : public std::runtime_error {
public:
    explicit HpiError(const std::string& message)
        : std::runtime_error(message) {}
};

// The update center could not be reached or its payload could not be parsed.
class CatalogFetchError : public HpiError {
public:
    explicit CatalogFetchError(const std::string& message)
        : HpiError(message) {}
};

// A requested plugin is not listed in the catalog.
class NotFoundError : public HpiError {
public:
    explicit NotFoundError(const std::string& message)
        : HpiError(message) {}
};

// Every mirror failed for a single artifact.
class DownloadError : public HpiError {
public:
    explicit DownloadError(const std::string& message)
        : HpiError(message) {}
};
