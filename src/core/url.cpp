#include "cricket/core/url.hpp"

#include <cctype>
#include <format>

namespace cricket::core {

std::string percentEncode(std::string_view Value) {
  std::string Out;
  Out.reserve(Value.size());
  for (unsigned char Ch : Value) {
    if (std::isalnum(Ch) || Ch == '-' || Ch == '_' || Ch == '.' || Ch == '~') {
      Out.push_back(static_cast<char>(Ch));
    } else {
      Out += std::format("%{:02X}", Ch);
    }
  }
  return Out;
}

static int hexValue(char Ch) {
  if (Ch >= '0' && Ch <= '9') {
    return Ch - '0';
  }
  if (Ch >= 'a' && Ch <= 'f') {
    return Ch - 'a' + 10;
  }
  if (Ch >= 'A' && Ch <= 'F') {
    return Ch - 'A' + 10;
  }
  return -1;
}

std::string percentDecode(std::string_view Value) {
  std::string Out;
  Out.reserve(Value.size());
  for (std::size_t I = 0; I < Value.size(); ++I) {
    if (Value[I] == '+') {
      Out.push_back(' ');
      continue;
    }
    if (Value[I] == '%' && I + 2 < Value.size()) {
      auto High = hexValue(Value[I + 1]);
      auto Low = hexValue(Value[I + 2]);
      if (High >= 0 && Low >= 0) {
        Out.push_back(static_cast<char>(High * 16 + Low));
        I += 2;
        continue;
      }
    }
    Out.push_back(Value[I]);
  }
  return Out;
}

std::string joinUrl(std::string_view Base, std::string_view Path) {
  while (!Base.empty() && Base.back() == '/') {
    Base.remove_suffix(1);
  }
  while (!Path.empty() && Path.front() == '/') {
    Path.remove_prefix(1);
  }
  if (Path.empty()) {
    return std::string(Base);
  }
  return std::format("{}/{}", Base, Path);
}

std::string buildUrl(
    std::string_view Base, std::string_view Path, const QueryParams &Params
) {
  auto Url = joinUrl(Base, Path);
  char Separator = '?';
  for (const auto &[Key, Value] : Params) {
    Url.push_back(Separator);
    Url += percentEncode(Key);
    Url.push_back('=');
    Url += percentEncode(Value);
    Separator = '&';
  }
  return Url;
}

std::unordered_map<std::string, std::string>
parseQuery(std::string_view Target) {
  std::unordered_map<std::string, std::string> Query;
  auto Mark = Target.find('?');
  if (Mark == std::string_view::npos) {
    return Query;
  }
  auto Rest = Target.substr(Mark + 1);
  if (auto Hash = Rest.find('#'); Hash != std::string_view::npos) {
    Rest = Rest.substr(0, Hash);
  }

  while (!Rest.empty()) {
    auto Amp = Rest.find('&');
    auto Pair = Rest.substr(0, Amp);
    if (!Pair.empty()) {
      auto Eq = Pair.find('=');
      auto Key = percentDecode(Pair.substr(0, Eq));
      std::string Value;
      if (Eq != std::string_view::npos) {
        Value = percentDecode(Pair.substr(Eq + 1));
      }
      // First occurrence wins.
      Query.try_emplace(std::move(Key), std::move(Value));
    }
    if (Amp == std::string_view::npos) {
      break;
    }
    Rest.remove_prefix(Amp + 1);
  }
  return Query;
}

} // namespace cricket::core
