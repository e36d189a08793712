#include "leniency.hpp"
#include <cstdint>

namespace z3n::engine {

namespace {

constexpr std::array<leniency_level, k_leniency_level_count> k_ladder = {
    leniency_level::exact, leniency_level::trailing_whitespace, leniency_level::normalized
};

bool is_ascii_space(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f'; }

std::string_view strip_trailing(std::string_view line) {
  while (!line.empty() && is_ascii_space(line.back())) {
    line.remove_suffix(1);
  }
  return line;
}

// decodes one utf-8 sequence at pos; returns 0 length for bytes that do not start a valid sequence
size_t decode_utf8(std::string_view s, size_t pos, uint32_t& cp) {
  auto byte = [&](size_t i) { return static_cast<uint8_t>(s[i]); };
  uint8_t lead = byte(pos);

  size_t length = 0;
  if ((lead & 0xe0) == 0xc0) {
    length = 2;
    cp = lead & 0x1f;
  } else if ((lead & 0xf0) == 0xe0) {
    length = 3;
    cp = lead & 0x0f;
  } else if ((lead & 0xf8) == 0xf0) {
    length = 4;
    cp = lead & 0x07;
  } else {
    return 0;
  }

  if (pos + length > s.size()) {
    return 0;
  }
  for (size_t i = 1; i < length; ++i) {
    uint8_t next = byte(pos + i);
    if ((next & 0xc0) != 0x80) {
      return 0;
    }
    cp = (cp << 6) | (next & 0x3f);
  }
  return length;
}

char lookalike_replacement(uint32_t cp) {
  switch (cp) {
  // hyphens, dashes, minus sign
  case 0x2010:
  case 0x2011:
  case 0x2012:
  case 0x2013:
  case 0x2014:
  case 0x2015:
  case 0x2212:
    return '-';
  case 0x2018:
  case 0x2019:
  case 0x201a:
  case 0x201b:
    return '\'';
  case 0x201c:
  case 0x201d:
  case 0x201e:
  case 0x201f:
    return '"';
  // no-break and fixed-width spaces
  case 0x00a0:
  case 0x2002:
  case 0x2003:
  case 0x2004:
  case 0x2005:
  case 0x2006:
  case 0x2007:
  case 0x2008:
  case 0x2009:
  case 0x200a:
  case 0x202f:
  case 0x205f:
  case 0x3000:
    return ' ';
  default:
    return '\0';
  }
}

std::string collapse_whitespace(std::string_view line) {
  std::string out;
  out.reserve(line.size());
  bool pending_space = false;
  for (char c : line) {
    if (is_ascii_space(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(c);
  }
  return out;
}

} // namespace

const std::array<leniency_level, k_leniency_level_count>& leniency_ladder() noexcept { return k_ladder; }

const char* leniency_level_name(leniency_level level) noexcept {
  switch (level) {
  case leniency_level::exact:
    return "exact";
  case leniency_level::trailing_whitespace:
    return "trailing_whitespace";
  case leniency_level::normalized:
    return "normalized";
  }
  return "unknown";
}

std::string fold_lookalikes(std::string_view line) {
  std::string out;
  out.reserve(line.size());

  size_t i = 0;
  while (i < line.size()) {
    if (static_cast<uint8_t>(line[i]) < 0x80) {
      out.push_back(line[i]);
      i++;
      continue;
    }

    uint32_t cp = 0;
    size_t length = decode_utf8(line, i, cp);
    if (length == 0) {
      out.push_back(line[i]);
      i++;
      continue;
    }

    char replacement = lookalike_replacement(cp);
    if (replacement != '\0') {
      out.push_back(replacement);
    } else {
      out.append(line.substr(i, length));
    }
    i += length;
  }
  return out;
}

std::string normalize_line(std::string_view line, leniency_level level) {
  switch (level) {
  case leniency_level::exact:
    return std::string(line);
  case leniency_level::trailing_whitespace:
    return std::string(strip_trailing(line));
  case leniency_level::normalized:
    return collapse_whitespace(fold_lookalikes(line));
  }
  return std::string(line);
}

bool lines_equal(std::string_view a, std::string_view b, leniency_level level) {
  if (level == leniency_level::exact) {
    return a == b;
  }
  if (level == leniency_level::trailing_whitespace) {
    return strip_trailing(a) == strip_trailing(b);
  }
  return normalize_line(a, level) == normalize_line(b, level);
}

} // namespace z3n::engine
