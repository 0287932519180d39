#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>
#include <limits>
#include <sstream>
#include <system_error>

#include "ascii_stl_reader.hpp"
#include "stlbox_exceptions.hpp"

[[nodiscard]] static std::string join_tokens(const auto &tokens) {
  std::string result = "[";
  for (size_t i = 0; i < tokens.size(); i++) {
    if (i > 0) {
      result += ", ";
    }
    result += std::format("\"{}\"", tokens[i]);
  }
  result += "]";
  return result;
}

// Decimal order of magnitude of a literal std::from_chars already matched in full, e.g. 3 for "1234.5" and
// -3 for "0.00125". Only called for out of range results, where the sign of the order tells underflow from overflow.
[[nodiscard]] static long long calc_decimal_order(std::string_view literal) {
  if (literal.starts_with('-')) {
    literal.remove_prefix(1);
  }
  size_t exponent_pos = literal.find_first_of("eE");
  std::string_view mantissa = literal.substr(0, exponent_pos);

  long long exponent = 0;
  if (exponent_pos != std::string_view::npos) {
    std::string_view exponent_digits = literal.substr(exponent_pos + 1);
    bool is_negative_exponent = exponent_digits.starts_with('-');
    if (exponent_digits.starts_with('-') || exponent_digits.starts_with('+')) {
      exponent_digits.remove_prefix(1);
    }
    auto [ptr, ec] =
        std::from_chars(exponent_digits.data(), exponent_digits.data() + exponent_digits.size(), exponent);
    if (ec == std::errc::result_out_of_range) {
      // Exponent alone dwarfs any mantissa
      return is_negative_exponent ? std::numeric_limits<long long>::min() / 2
                                  : std::numeric_limits<long long>::max() / 2;
    }
    if (is_negative_exponent) {
      exponent = -exponent;
    }
  }

  size_t point_pos = mantissa.find('.');
  size_t num_integer_digits = point_pos == std::string_view::npos ? mantissa.size() : point_pos;
  size_t first_significant = mantissa.find_first_not_of("0.");
  if (first_significant == std::string_view::npos) {
    return 0;
  }
  long long order = first_significant < num_integer_digits
                        ? static_cast<long long>(num_integer_digits - first_significant) - 1
                        : -static_cast<long long>(first_significant - num_integer_digits);
  return order + exponent;
}

float parse_ascii_stl_float(std::string_view token) {
  std::string_view digits = token;
  if (digits.starts_with('+')) {
    digits.remove_prefix(1);
    // Only a single sign is allowed
    if (digits.starts_with('+') || digits.starts_with('-')) {
      throw Invalid_Numeric_Error(std::format("invalid float literal \"{}\"", token));
    }
  }
  float value = 0.0f;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (digits.empty() || ptr != digits.data() + digits.size() ||
      (ec != std::errc() && ec != std::errc::result_out_of_range)) {
    throw Invalid_Numeric_Error(std::format("invalid float literal \"{}\"", token));
  }
  if (ec == std::errc::result_out_of_range) {
    if (calc_decimal_order(digits) >= 0) {
      throw Invalid_Numeric_Error(std::format("expected finite f32, got \"{}\" which overflows", token));
    }
    // Too small for even the smallest subnormal, rounds to zero keeping the sign
    return digits.starts_with('-') ? -0.0f : 0.0f;
  }
  if (!std::isfinite(value)) {
    throw Invalid_Numeric_Error(std::format("expected finite f32, got \"{}\"", token));
  }
  return value;
}

Ascii_Stl_Reader::Ascii_Stl_Reader(std::istream &is) : m_is(is) {
  std::string line;
  if (!std::getline(m_is, line)) {
    if (m_is.bad()) {
      throw Io_Error("Failed to read from stream");
    }
    throw Unexpected_End_Error("empty file?");
  }
  if (!line.starts_with(ASCII_STL_SOLID_PREFIX)) {
    throw Malformed_Structure_Error("ascii STL does not start with \"solid \"");
  }
}

std::optional<std::vector<std::string>> Ascii_Stl_Reader::next_tokens() {
  std::string line;
  while (std::getline(m_is, line)) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) {
      tokens.push_back(token);
    }
    // Skip blank lines
    if (!tokens.empty()) {
      return tokens;
    }
  }
  if (m_is.bad()) {
    throw Io_Error("Failed to read from stream");
  }
  return std::nullopt;
}

void Ascii_Stl_Reader::expect_tokens(const std::vector<std::string_view> &expected) {
  auto tokens = next_tokens();
  if (!tokens) {
    throw Unexpected_End_Error(std::format("EOF while expecting {}", join_tokens(expected)));
  }
  if (!std::equal(tokens->begin(), tokens->end(), expected.begin(), expected.end())) {
    throw Malformed_Structure_Error(
        std::format("expected {}, got {}", join_tokens(expected), join_tokens(*tokens)));
  }
}

glm::vec3 Ascii_Stl_Reader::parse_vec3(const std::vector<std::string> &tokens, size_t first) {
  return glm::vec3(parse_ascii_stl_float(tokens[first]), parse_ascii_stl_float(tokens[first + 1]),
                   parse_ascii_stl_float(tokens[first + 2]));
}

Triangle Ascii_Stl_Reader::read_facet(const std::vector<std::string> &facet_header) {
  if (facet_header.size() != 5 || facet_header[0] != "facet" || facet_header[1] != "normal") {
    throw Malformed_Structure_Error(std::format("invalid facet header: {}", join_tokens(facet_header)));
  }
  Triangle t;
  t.normal = parse_vec3(facet_header, 2);
  expect_tokens({"outer", "loop"});
  for (glm::vec3 &vertex : t.vertices) {
    auto tokens = next_tokens();
    if (!tokens) {
      throw Unexpected_End_Error("EOF while expecting vertex");
    }
    if (tokens->size() != 4 || (*tokens)[0] != "vertex") {
      throw Malformed_Structure_Error(std::format("expected \"vertex f32 f32 f32\", got {}", join_tokens(*tokens)));
    }
    vertex = parse_vec3(*tokens, 1);
  }
  expect_tokens({"endloop"});
  expect_tokens({"endfacet"});
  return t;
}

std::optional<Triangle> Ascii_Stl_Reader::next() {
  if (m_done) {
    return std::nullopt;
  }
  // Any error ends the stream, so mark it done until a facet has been fully read
  m_done = true;
  auto facet_header = next_tokens();
  if (!facet_header) {
    throw Unexpected_End_Error("EOF while expecting facet or endsolid");
  }
  // Name after endsolid is not checked against the name after solid
  if ((*facet_header)[0] == "endsolid") {
    return std::nullopt;
  }
  Triangle t = read_facet(*facet_header);
  m_done = false;
  return t;
}
