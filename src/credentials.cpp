#include "credentials.hpp"
#include <utility>

void secureWipe(std::string& text) noexcept {
    volatile char* data = text.data();
    for (std::size_t i = 0; i < text.size(); ++i) {
        data[i] = '\0';
    }
    text.clear();
}

ScopedSecret::ScopedSecret(std::string value) : value_(std::move(value)) {}

ScopedSecret::ScopedSecret(ScopedSecret&& other) : value_(other.value_) {
    other.clear();
}

ScopedSecret& ScopedSecret::operator=(ScopedSecret&& other) {
    if (this != &other) {
        clear();
        value_ = other.value_;
        other.clear();
    }
    return *this;
}

ScopedSecret::~ScopedSecret() {
    clear();
}

void ScopedSecret::clear() noexcept {
    secureWipe(value_);
}
