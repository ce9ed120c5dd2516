#pragma once

namespace splitpack {

class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const;
    bool Valid() const;

    void Reset(int fd);
    // Closes and reports the close(2) result; errno is preserved on failure.
    int Close();

  private:
    int fd_{-1};
};

} // namespace splitpack
