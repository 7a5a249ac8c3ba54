#include "wayfarer/accept-encoding-negotiation.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>
#include <system_error>
#include <type_traits>

#include "wayfarer/compression-config.hpp"
#include "wayfarer/encoding.hpp"
#include "wayfarer/http-constants.hpp"
#include "wayfarer/string-equal-ignore-case.hpp"

namespace wayfarer {
namespace {

constexpr std::string_view kWhitespace = " \t";

constexpr std::string_view Trim(std::string_view sv) {
  while (!sv.empty() && kWhitespace.find(sv.front()) != std::string_view::npos) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && kWhitespace.find(sv.back()) != std::string_view::npos) {
    sv.remove_suffix(1);
  }
  return sv;
}

// Parse q-value among the parameters of a token; never throws.
double ParseQ(std::string_view params) {
  while (!params.empty()) {
    const auto nextSemi = params.find(';');
    const std::string_view param = Trim(params.substr(0, nextSemi));
    params.remove_prefix(nextSemi == std::string_view::npos ? params.size() : nextSemi + 1);

    if (param.size() < 2 || (param[0] != 'q' && param[0] != 'Q') || param[1] != '=') {
      continue;
    }
    const std::string_view val = Trim(param.substr(2));
    double qualityValue = 0.0;
    const auto [ptr, errc] = std::from_chars(val.data(), val.data() + val.size(), qualityValue);
    if (val.empty() || errc != std::errc() || ptr != val.data() + val.size()) {
      return 0.0;
    }
    return std::clamp(qualityValue, 0.0, 1.0);
  }
  return 1.0;
}

constexpr auto ToIdx(Encoding enc) { return static_cast<std::underlying_type_t<Encoding>>(enc); }

}  // namespace

EncodingSelector::EncodingSelector() : EncodingSelector(CompressionConfig{}) {}

EncodingSelector::EncodingSelector(const CompressionConfig &compressionConfig) {
  _serverPrefIndex.fill(-1);
  auto add = [this](Encoding enc) {
    if (enc != Encoding::none && IsEncodingEnabled(enc) && _serverPrefIndex[ToIdx(enc)] == -1) {
      _serverPrefIndex[ToIdx(enc)] = static_cast<int8_t>(_preferenceOrdered.size());
      _preferenceOrdered.push_back(enc);
    }
  };
  if (compressionConfig.preferredFormats.empty()) {
    for (std::underlying_type_t<Encoding> pos = 0; pos < kNbContentEncodings; ++pos) {
      add(static_cast<Encoding>(pos));
    }
  } else {
    // preferredFormats defines the full server-advertised order.
    std::ranges::for_each(compressionConfig.preferredFormats, add);
  }
}

EncodingSelector::NegotiatedResult EncodingSelector::negotiateAcceptEncoding(std::string_view acceptEncoding) const {
  NegotiatedResult ret;

  // Quality per encoding, negative when not mentioned. Earliest occurrence wins.
  std::array<double, kNbContentEncodings> qualities;
  qualities.fill(-1.0);
  double wildcardQ = -1.0;

  while (!acceptEncoding.empty()) {
    const auto commaPos = acceptEncoding.find(',');
    const std::string_view raw = Trim(acceptEncoding.substr(0, commaPos));
    acceptEncoding.remove_prefix(commaPos == std::string_view::npos ? acceptEncoding.size() : commaPos + 1);
    if (raw.empty()) {
      continue;
    }
    const auto sc = raw.find(';');
    const std::string_view name = Trim(raw.substr(0, sc));
    const double quality = sc == std::string_view::npos ? 1.0 : ParseQ(raw.substr(sc + 1));
    if (name == "*") {
      wildcardQ = quality;
      continue;
    }
    for (std::underlying_type_t<Encoding> pos = 0; pos < kNbContentEncodings; ++pos) {
      if (qualities[pos] < 0.0 && CaseInsensitiveEqual(name, GetEncodingStr(static_cast<Encoding>(pos)))) {
        qualities[pos] = quality;
        break;
      }
    }
  }

  double bestQ = 0.0;
  int bestServerPreferenceIndex = std::numeric_limits<int>::max();
  for (Encoding enc : _preferenceOrdered) {
    double quality = qualities[ToIdx(enc)];
    if (quality < 0.0) {
      quality = wildcardQ;
    }
    const int serverIdx = _serverPrefIndex[ToIdx(enc)];
    // q=0 means "not acceptable"
    if (quality > bestQ || (quality > 0.0 && quality == bestQ && serverIdx < bestServerPreferenceIndex)) {
      bestQ = quality;
      bestServerPreferenceIndex = serverIdx;
      ret.encoding = enc;
    }
  }

  if (ret.encoding == Encoding::none) {
    double identityQ = qualities[ToIdx(Encoding::none)];
    if (identityQ < 0.0) {
      identityQ = wildcardQ;
    }
    ret.reject = identityQ == 0.0;
  }
  return ret;
}

}  // namespace wayfarer
