#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <functional>

namespace splitpack {

using CopyProgressFn = std::function<void(std::uint64_t delta)>;

// Copies exactly `count` bytes; a short source is an error.
Result CopyN(IReader& src, IWriter& dst, std::uint64_t count, const CopyProgressFn& on_progress = {});

// Copies until the source reports end of stream. `copied` receives the byte count.
Result CopyAll(IReader& src, IWriter& dst, std::uint64_t& copied, const CopyProgressFn& on_progress = {});

} // namespace splitpack
