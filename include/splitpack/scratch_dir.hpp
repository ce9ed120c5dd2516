#pragma once

#include "util/result.hpp"

#include <string>

namespace splitpack {

// Private mkdtemp directory, removed recursively on destruction unless Keep()
// was called.
class ScratchDirectory {
public:
    // Creates "<parent>/.<prefix>-XXXXXX".
    static Result Create(const std::string& parent, const std::string& prefix, ScratchDirectory& out);

    ScratchDirectory();
    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;
    ScratchDirectory(ScratchDirectory&& other) noexcept;
    ScratchDirectory& operator=(ScratchDirectory&& other) noexcept;
    ~ScratchDirectory();

    const std::string& Path() const;
    std::string Join(const std::string& name) const;
    void Keep() { keep_ = true; }

private:
    void Cleanup();

    std::string path_;
    bool keep_ = false;
};

} // namespace splitpack
