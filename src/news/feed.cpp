#include "cricket/news/feed.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace cricket::news {

namespace {

struct Element {
  std::size_t Start{0};
  std::string_view Attributes;
  std::string_view Inner;
  std::size_t End{0};
};

bool isNameEnd(char Ch) {
  return Ch == '>' || Ch == '/' || std::isspace(static_cast<unsigned char>(Ch));
}

// Position of the next "<{Lead}{Name}" with a proper tag boundary after it,
// so that "<item" never matches "<items". CDATA sections and comments are
// opaque: markup inside them is never matched.
std::size_t findMarkup(
    std::string_view Xml, std::string_view Lead, std::string_view Name,
    std::size_t From
) {
  constexpr std::string_view CdataOpen = "<![CDATA[";
  constexpr std::string_view CommentOpen = "<!--";

  while (From < Xml.size()) {
    auto Pos = Xml.find('<', From);
    if (Pos == std::string_view::npos) {
      return std::string_view::npos;
    }
    auto Rest = Xml.substr(Pos);
    if (Rest.starts_with(CdataOpen) || Rest.starts_with(CommentOpen)) {
      auto Close = Rest.starts_with(CdataOpen) ? Xml.find("]]>", Pos)
                                               : Xml.find("-->", Pos);
      if (Close == std::string_view::npos) {
        return std::string_view::npos;
      }
      From = Close + 3;
      continue;
    }

    auto NameAt = Pos + 1 + Lead.size();
    auto After = NameAt + Name.size();
    if (After < Xml.size() && Rest.substr(1).starts_with(Lead) &&
        Xml.substr(NameAt, Name.size()) == Name && isNameEnd(Xml[After])) {
      return Pos;
    }
    From = Pos + 1;
  }
  return std::string_view::npos;
}

std::size_t findTag(std::string_view Xml, std::string_view Name, std::size_t From) {
  return findMarkup(Xml, "", Name, From);
}

std::optional<Element>
nextElement(std::string_view Xml, std::string_view Name, std::size_t From) {
  auto Open = findTag(Xml, Name, From);
  if (Open == std::string_view::npos) {
    return std::nullopt;
  }
  auto OpenEnd = Xml.find('>', Open);
  if (OpenEnd == std::string_view::npos) {
    return std::nullopt;
  }

  auto AttrStart = Open + 1 + Name.size();
  auto Attributes = Xml.substr(AttrStart, OpenEnd - AttrStart);
  if (!Attributes.empty() && Attributes.back() == '/') {
    Attributes.remove_suffix(1);
    return Element{
        .Start = Open, .Attributes = Attributes, .Inner = {}, .End = OpenEnd + 1
    };
  }

  auto CloseStart = findMarkup(Xml, "/", Name, OpenEnd + 1);
  if (CloseStart == std::string_view::npos) {
    return std::nullopt;
  }
  auto CloseEnd = Xml.find('>', CloseStart);
  if (CloseEnd == std::string_view::npos) {
    CloseEnd = Xml.size() - 1;
  }
  return Element{
      .Start = Open,
      .Attributes = Attributes,
      .Inner = Xml.substr(OpenEnd + 1, CloseStart - OpenEnd - 1),
      .End = CloseEnd + 1,
  };
}

std::optional<std::string>
attribute(std::string_view Attributes, std::string_view Name) {
  std::size_t From = 0;
  while (From < Attributes.size()) {
    auto Pos = Attributes.find(Name, From);
    if (Pos == std::string_view::npos) {
      return std::nullopt;
    }
    From = Pos + 1;
    if (Pos > 0 && !std::isspace(static_cast<unsigned char>(Attributes[Pos - 1]))) {
      continue;
    }
    auto Cursor = Pos + Name.size();
    while (Cursor < Attributes.size() &&
           std::isspace(static_cast<unsigned char>(Attributes[Cursor]))) {
      ++Cursor;
    }
    if (Cursor >= Attributes.size() || Attributes[Cursor] != '=') {
      continue;
    }
    ++Cursor;
    while (Cursor < Attributes.size() &&
           std::isspace(static_cast<unsigned char>(Attributes[Cursor]))) {
      ++Cursor;
    }
    if (Cursor >= Attributes.size()) {
      return std::nullopt;
    }
    auto Quote = Attributes[Cursor];
    if (Quote != '"' && Quote != '\'') {
      continue;
    }
    auto ValueEnd = Attributes.find(Quote, Cursor + 1);
    if (ValueEnd == std::string_view::npos) {
      return std::nullopt;
    }
    return decodeEntities(Attributes.substr(Cursor + 1, ValueEnd - Cursor - 1));
  }
  return std::nullopt;
}

std::string_view trim(std::string_view Text) {
  while (!Text.empty() && std::isspace(static_cast<unsigned char>(Text.front()))) {
    Text.remove_prefix(1);
  }
  while (!Text.empty() && std::isspace(static_cast<unsigned char>(Text.back()))) {
    Text.remove_suffix(1);
  }
  return Text;
}

// Element text with CDATA sections kept verbatim and everything else
// entity-decoded.
std::string textOf(std::string_view Inner) {
  constexpr std::string_view CdataOpen = "<![CDATA[";
  constexpr std::string_view CdataClose = "]]>";

  std::string Out;
  while (!Inner.empty()) {
    auto Start = Inner.find(CdataOpen);
    if (Start == std::string_view::npos) {
      Out += decodeEntities(Inner);
      break;
    }
    Out += decodeEntities(Inner.substr(0, Start));
    auto BodyStart = Start + CdataOpen.size();
    auto End = Inner.find(CdataClose, BodyStart);
    if (End == std::string_view::npos) {
      Out += Inner.substr(BodyStart);
      break;
    }
    Out += Inner.substr(BodyStart, End - BodyStart);
    Inner.remove_prefix(End + CdataClose.size());
  }
  return std::string(trim(Out));
}

std::optional<std::string> childText(std::string_view Xml, std::string_view Name) {
  auto Child = nextElement(Xml, Name, 0);
  if (!Child) {
    return std::nullopt;
  }
  return textOf(Child->Inner);
}

std::optional<std::string>
firstChildText(std::string_view Xml, std::initializer_list<std::string_view> Names) {
  for (auto Name : Names) {
    if (auto Text = childText(Xml, Name)) {
      return Text;
    }
  }
  return std::nullopt;
}

std::vector<std::string> urlsOf(std::string_view Xml, std::string_view Name) {
  std::vector<std::string> Urls;
  std::size_t From = 0;
  while (auto Child = nextElement(Xml, Name, From)) {
    if (auto Url = attribute(Child->Attributes, "url")) {
      Urls.push_back(std::move(*Url));
    }
    // Non-self-closing media:content may wrap a thumbnail, so scanning
    // resumes right after the opening tag rather than after the element.
    From = Child->Start + 1;
  }
  return Urls;
}

// RSS carries the link as text, Atom as <link rel="alternate" href="..."/>.
std::optional<std::string> linkOf(std::string_view Xml) {
  std::optional<std::string> Fallback;
  std::size_t From = 0;
  while (auto Link = nextElement(Xml, "link", From)) {
    From = Link->End;
    if (auto Href = attribute(Link->Attributes, "href")) {
      auto Rel = attribute(Link->Attributes, "rel");
      if (!Rel || *Rel == "alternate") {
        return Href;
      }
      if (!Fallback) {
        Fallback = std::move(Href);
      }
      continue;
    }
    auto Text = textOf(Link->Inner);
    if (!Text.empty()) {
      return Text;
    }
  }
  if (Fallback) {
    return Fallback;
  }

  // RSS items without <link> may use a permalink guid instead.
  if (auto Guid = nextElement(Xml, "guid", 0)) {
    auto PermaLink = attribute(Guid->Attributes, "isPermaLink");
    auto Text = textOf(Guid->Inner);
    if (PermaLink != "false" && !Text.empty()) {
      return Text;
    }
  }
  return std::nullopt;
}

FeedEntry parseEntry(std::string_view Xml) {
  return {
      .Title = childText(Xml, "title"),
      .Link = linkOf(Xml),
      .Summary = firstChildText(Xml, {"description", "summary"}),
      .Published = firstChildText(Xml, {"pubDate", "published", "dc:date"}),
      .Updated = childText(Xml, "updated"),
      .Thumbnails = urlsOf(Xml, "media:thumbnail"),
      .MediaContent = urlsOf(Xml, "media:content"),
  };
}

void appendUtf8(std::string &Out, std::uint32_t CodePoint) {
  if (CodePoint < 0x80) {
    Out.push_back(static_cast<char>(CodePoint));
  } else if (CodePoint < 0x800) {
    Out.push_back(static_cast<char>(0xC0 | (CodePoint >> 6)));
    Out.push_back(static_cast<char>(0x80 | (CodePoint & 0x3F)));
  } else if (CodePoint < 0x10000) {
    Out.push_back(static_cast<char>(0xE0 | (CodePoint >> 12)));
    Out.push_back(static_cast<char>(0x80 | ((CodePoint >> 6) & 0x3F)));
    Out.push_back(static_cast<char>(0x80 | (CodePoint & 0x3F)));
  } else {
    Out.push_back(static_cast<char>(0xF0 | (CodePoint >> 18)));
    Out.push_back(static_cast<char>(0x80 | ((CodePoint >> 12) & 0x3F)));
    Out.push_back(static_cast<char>(0x80 | ((CodePoint >> 6) & 0x3F)));
    Out.push_back(static_cast<char>(0x80 | (CodePoint & 0x3F)));
  }
}

} // namespace

std::string decodeEntities(std::string_view Text) {
  std::string Out;
  Out.reserve(Text.size());
  std::size_t I = 0;
  while (I < Text.size()) {
    if (Text[I] != '&') {
      Out.push_back(Text[I++]);
      continue;
    }
    auto Semi = Text.find(';', I);
    if (Semi == std::string_view::npos || Semi - I > 10) {
      Out.push_back(Text[I++]);
      continue;
    }
    auto Name = Text.substr(I + 1, Semi - I - 1);
    if (Name == "amp") {
      Out.push_back('&');
    } else if (Name == "lt") {
      Out.push_back('<');
    } else if (Name == "gt") {
      Out.push_back('>');
    } else if (Name == "quot") {
      Out.push_back('"');
    } else if (Name == "apos") {
      Out.push_back('\'');
    } else if (Name.size() > 1 && Name[0] == '#') {
      auto Digits = Name.substr(1);
      int Base = 10;
      if (!Digits.empty() && (Digits[0] == 'x' || Digits[0] == 'X')) {
        Digits.remove_prefix(1);
        Base = 16;
      }
      std::uint32_t CodePoint = 0;
      auto [Ptr, Ec] = std::from_chars(
          Digits.data(), Digits.data() + Digits.size(), CodePoint, Base
      );
      if (Ec != std::errc{} || Ptr != Digits.data() + Digits.size() ||
          CodePoint > 0x10FFFF) {
        Out.append(Text.substr(I, Semi - I + 1));
      } else {
        appendUtf8(Out, CodePoint);
      }
    } else {
      Out.append(Text.substr(I, Semi - I + 1));
    }
    I = Semi + 1;
  }
  return Out;
}

auto parseFeed(std::string_view Xml) -> std::expected<Feed, core::Error> {
  auto Rss = findTag(Xml, "rss", 0);
  auto Rdf = findTag(Xml, "rdf:RDF", 0);
  auto Atom = findTag(Xml, "feed", 0);
  if (Rss == std::string_view::npos && Rdf == std::string_view::npos &&
      Atom == std::string_view::npos) {
    return std::unexpected(
        core::Error::internal("Document is not an RSS or Atom feed")
    );
  }

  // Whichever root appears first decides the entry element.
  bool IsAtom = Atom != std::string_view::npos && Atom < Rss && Atom < Rdf;
  std::string_view EntryTag = IsAtom ? "entry" : "item";

  Feed Result;
  auto FirstEntry = findTag(Xml, EntryTag, 0);
  Result.Title = childText(Xml.substr(0, FirstEntry), "title");

  std::size_t From = 0;
  while (auto Entry = nextElement(Xml, EntryTag, From)) {
    Result.Entries.push_back(parseEntry(Entry->Inner));
    From = Entry->End;
  }
  return Result;
}

NewsItem toNewsItem(const FeedEntry &Entry, std::string_view Source) {
  std::optional<std::string> Image;
  if (!Entry.Thumbnails.empty()) {
    Image = Entry.Thumbnails.front();
  } else if (!Entry.MediaContent.empty()) {
    Image = Entry.MediaContent.front();
  }

  return {
      .Title = Entry.Title,
      .Link = Entry.Link,
      .Summary = Entry.Summary.value_or(""),
      .Published = Entry.Published ? Entry.Published : Entry.Updated,
      .Source = std::string(Source),
      .Image = std::move(Image),
  };
}

} // namespace cricket::news
