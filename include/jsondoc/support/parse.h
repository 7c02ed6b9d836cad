#pragma once

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

#include <jsondoc/support/exception.h>

namespace jsondoc::parse {

template <typename StringType>
class StringStreamAdapter
{
  public:
    StringStreamAdapter(const StringType& str) : m_str{str} {}

    char peek() const { return done()? 0: m_str[m_pos]; }
    void next() { if (!done()) ++m_pos; }
    size_t consumed() const { return m_pos; }
    bool done() const { return m_pos == m_str.size(); }

    const StringType& source() const { return m_str; }

  private:
    StringType m_str;
    size_t m_pos = 0;
};


constexpr int syntax_context = 72;

struct SyntaxError : public JsonDocException
{
    static std::string make_message(const std::string_view& spec, std::ptrdiff_t offset, const std::string& message) {
        std::ptrdiff_t ctx_end = std::min(offset + syntax_context, (std::ptrdiff_t)spec.size());
        std::ptrdiff_t ctx_begin = std::max(ctx_end - syntax_context, (std::ptrdiff_t)0);
        std::stringstream ss;
        ss << message << " at offset " << offset << std::endl;
        auto it = spec.cbegin();
        auto end = it + ctx_end;
        it += ctx_begin;
        for (; it != end; ++it) ss << *it;
        ss << std::endl;
        ss << std::setfill('-') << std::setw(offset - ctx_begin + 1) << '^';
        return ss.str();
    }

    SyntaxError(const std::string_view& spec, std::ptrdiff_t offset, const std::string& message)
      : JsonDocException(make_message(spec, offset, message)), m_offset{offset} {}

    std::ptrdiff_t offset() const { return m_offset; }

  private:
    std::ptrdiff_t m_offset;
};

} // namespace jsondoc::parse
