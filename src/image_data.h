#pragma once

#include <exception>
#include <string>

// Exception class for thumbnail generation failures
class ThumbnailGenerationException : public std::exception {
protected:
    std::string message_;
public:
    explicit ThumbnailGenerationException(const std::string& message) : message_(message) {}
    const char* what() const noexcept override { return message_.c_str(); }
};

// Memory cleanup strategy for ImageData
enum class OnDestroy {
    NONE,       // Don't free (data is managed elsewhere)
    FREE,       // Use free() - allocated with malloc/calloc
    STBI_FREE   // Use stbi_image_free() - allocated by stb_image
};

// Decoded 8-bit pixels, rows top to bottom, channels interleaved
struct ImageData {
    unsigned char* data;
    int width;
    int height;
    int channels;
    OnDestroy on_destroy; // How to free memory on destruction

    ImageData() : data(nullptr), width(0), height(0), channels(0), on_destroy(OnDestroy::STBI_FREE) {}

    // Move constructor
    ImageData(ImageData&& other) noexcept
        : data(other.data), width(other.width), height(other.height),
          channels(other.channels), on_destroy(other.on_destroy) {
        other.data = nullptr; // Transfer ownership
    }

    // Move assignment
    ImageData& operator=(ImageData&& other) noexcept {
        if (this != &other) {
            cleanup();
            data = other.data;
            width = other.width;
            height = other.height;
            channels = other.channels;
            on_destroy = other.on_destroy;
            other.data = nullptr; // Transfer ownership
        }
        return *this;
    }

    // Disable copy operations
    ImageData(const ImageData&) = delete;
    ImageData& operator=(const ImageData&) = delete;

    ~ImageData() {
        cleanup();
    }

    bool is_valid() const {
        return data != nullptr && width > 0 && height > 0 && channels > 0;
    }

private:
    void cleanup(); // Implementation in thumbnail_pipeline.cpp
};
