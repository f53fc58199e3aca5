#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>
#include <sys/types.h>

namespace seed {

// Regular file opened for writing, created or truncated with exact permission bits.
class FileWriter final : public IWriter {
  public:
    static Result Open(std::string path, mode_t mode, FileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;

    // Surfaces close(2) failures, which can carry deferred write errors.
    Result Close();

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
};

} // namespace seed
