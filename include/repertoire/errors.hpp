#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace repertoire
{
  class Error : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  class InvalidGrade : public Error
  {
  public:
    explicit InvalidGrade(int grade)
        : Error("grade must be 0..5, got " + std::to_string(grade)), m_grade(grade) {}

    int grade() const noexcept { return m_grade; }

  private:
    int m_grade;
  };

  class EmptyTarget : public Error
  {
  public:
    EmptyTarget() : Error("opening has no move tokens to quiz on") {}
  };

  class IllegalToken : public Error
  {
  public:
    IllegalToken(std::string token, std::size_t ply, const std::string &why)
        : Error("illegal move token '" + token + "' at ply " + std::to_string(ply + 1) + ": " + why),
          m_token(std::move(token)), m_ply(ply) {}

    const std::string &token() const noexcept { return m_token; }
    std::size_t ply() const noexcept { return m_ply; }

  private:
    std::string m_token;
    std::size_t m_ply;
  };

  class StoreError : public Error
  {
  public:
    using Error::Error;
  };

  class UsageError : public Error
  {
  public:
    using Error::Error;
  };

} // namespace repertoire
