#include "statsd_encoder.hpp"

#include <ctype.h>
#include <stdlib.h>

#include <cmath>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>

#include "tag_datadog.hpp"

namespace {
  /**
   * Finds the shortest digit string which parses back to 'magnitude' (finite and > 0), as
   * 0.<digits> x 10^point_pos.
   */
  void shortest_digits(double magnitude, std::string& digits, int& point_pos) {
    std::string sci;
    for (int precision = 0; precision < std::numeric_limits<double>::max_digits10; ++precision) {
      std::ostringstream oss;
      oss.imbue(std::locale::classic());
      oss << std::scientific << std::setprecision(precision) << magnitude;
      sci = oss.str();
      if (strtod(sci.c_str(), NULL) == magnitude) {
        break;
      }
    }

    // "d.ddde+XX"
    size_t exp_pos = sci.find('e');
    digits.clear();
    for (size_t i = 0; i < exp_pos; ++i) {
      if (isdigit((unsigned char) sci[i])) {
        digits.push_back(sci[i]);
      }
    }
    point_pos = atoi(sci.c_str() + exp_pos + 1) + 1;
  }

  // Adds one to a string of decimal digits, eg "199" => "200", "99" => "100", "" => "1".
  void increment_digits(std::string& digits) {
    for (size_t i = digits.size(); i > 0; --i) {
      if (digits[i - 1] == '9') {
        digits[i - 1] = '0';
      } else {
        ++digits[i - 1];
        return;
      }
    }
    digits.insert(digits.begin(), '1');
  }
}

const int statsd::statsd_encoder::FLOAT_PRECISION;

std::string statsd::statsd_encoder::normalize_prefix(const std::string& prefix) {
  if (prefix.empty()) {
    return prefix;
  }
  return prefix + '.';
}

const char* statsd::statsd_encoder::type_code(metric_type::Value type) {
  switch (type) {
    case metric_type::COUNTER:
      return "c";
    case metric_type::GAUGE:
      return "g";
    case metric_type::TIMER:
      return "ms";
    case metric_type::HISTOGRAM:
      return "h";
    case metric_type::UNKNOWN:
      break;
  }
  // Not reachable through the client API. Emit a gauge rather than produce an unparseable line.
  return "g";
}

std::string statsd::statsd_encoder::to_fixed(double value, int places) {
  if (!std::isfinite(value)) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << value;
    return oss.str();
  }

  // 'units' counts multiples of 10^-places
  std::string units;
  if (value != 0) {
    std::string digits;
    int point_pos;
    shortest_digits(std::fabs(value), digits, point_pos);

    int keep = point_pos + places;
    if (keep >= 0) {
      if ((size_t) keep >= digits.size()) {
        units = digits + std::string(keep - digits.size(), '0');
      } else {
        units = digits.substr(0, keep);
        const char first_dropped = digits[keep];
        const bool rest_nonzero = digits.find_first_not_of('0', keep + 1) != std::string::npos;
        const bool last_kept_odd = !units.empty() && (units[units.size() - 1] - '0') % 2 == 1;
        if (first_dropped > '5' || (first_dropped == '5' && (rest_nonzero || last_kept_odd))) {
          increment_digits(units);
        }
      }
    }
    // keep < 0: the first dropped digit is a leading zero, so it all rounds down to zero
  }

  const bool negative =
    value < 0 && units.find_first_not_of('0') != std::string::npos;
  if (units.size() <= (size_t) places) {
    units.insert(0, places + 1 - units.size(), '0');
  }

  std::string out;
  if (negative) {
    out.push_back('-');
  }
  out.append(units, 0, units.size() - places);
  if (places > 0) {
    out.push_back('.');
    out.append(units, units.size() - places, std::string::npos);
  }
  return out;
}

std::string statsd::statsd_encoder::format_value(const MetricValue& value) {
  if (value.is_integer()) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << value.int_value();
    return oss.str();
  }
  return to_fixed(value.float_value(), FLOAT_PRECISION);
}

std::string statsd::statsd_encoder::encode(const std::string& prefix, const MetricPoint& point,
    const tags_t& constant_tags) {
  std::string line = prefix + point.name + ':' + format_value(point.value) + '|'
    + type_code(point.type);
  if (point.sample_rate != 1.0) {
    line.append("|@");
    line.append(to_fixed(point.sample_rate, FLOAT_PRECISION));
  }
  tag_datadog::append_tags(line, constant_tags, point.tags);
  return line;
}
