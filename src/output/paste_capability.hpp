#pragma once

#include <string_view>

class PasteCapability {
public:
    virtual ~PasteCapability() = default;
    // Returns true if the clipboard contents were delivered to the focused control.
    virtual bool paste() = 0;
    virtual std::string_view name() const = 0;
};
