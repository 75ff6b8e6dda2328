#pragma once

#include "util/result.hpp"

namespace curator {

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

    int Release();
    void Reset(int fd);
    Result Close();

  private:
    int fd_{-1};
};

} // namespace curator
