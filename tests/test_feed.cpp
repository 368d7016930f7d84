#include <catch2/catch_test_macros.hpp>

#include "cricket/news/feed.hpp"

using namespace cricket;

TEST_CASE("RSS 2.0 documents", "[feed]") {
  constexpr auto Xml = R"(<?xml version="1.0" encoding="UTF-8"?>
<rss version="2.0" xmlns:media="http://search.yahoo.com/mrss/">
  <channel>
    <title>ESPNcricinfo</title>
    <link>https://www.espncricinfo.com</link>
    <item>
      <title>Root &amp; Brook build the lead</title>
      <link>https://example.test/story/1</link>
      <description><![CDATA[<p>England <b>extend</b> their lead</p>]]></description>
      <pubDate>Sat, 02 Nov 2024 10:00:00 GMT</pubDate>
      <media:content url="https://img.test/content.jpg" medium="image">
        <media:thumbnail url="https://img.test/thumb.jpg"/>
      </media:content>
    </item>
    <item>
      <title>Second story</title>
      <link>https://example.test/story/2</link>
    </item>
  </channel>
</rss>)";

  auto Feed = news::parseFeed(Xml);
  REQUIRE(Feed);
  REQUIRE(Feed->Title == "ESPNcricinfo");
  REQUIRE(Feed->Entries.size() == 2);

  const auto &First = Feed->Entries[0];
  REQUIRE(First.Title == "Root & Brook build the lead");
  REQUIRE(First.Link == "https://example.test/story/1");
  REQUIRE(First.Summary == "<p>England <b>extend</b> their lead</p>");
  REQUIRE(First.Published == "Sat, 02 Nov 2024 10:00:00 GMT");
  REQUIRE(First.Thumbnails.size() == 1);
  REQUIRE(First.MediaContent.size() == 1);

  auto Item = news::toNewsItem(First, "ESPNcricinfo");
  REQUIRE(Item.Image == "https://img.test/thumb.jpg");
  REQUIRE(Item.Source == "ESPNcricinfo");

  auto Bare = news::toNewsItem(Feed->Entries[1], "ESPNcricinfo");
  REQUIRE(Bare.Summary.empty());
  REQUIRE_FALSE(Bare.Published.has_value());
  REQUIRE_FALSE(Bare.Image.has_value());
}

TEST_CASE("Atom documents", "[feed]") {
  constexpr auto Xml = R"(<?xml version="1.0" encoding="utf-8"?>
<feed xmlns="http://www.w3.org/2005/Atom">
  <title type="text">ICC News</title>
  <link href="https://www.icc-cricket.com" rel="self"/>
  <entry>
    <title>Rankings update</title>
    <link rel="edit" href="https://icc.test/edit/9"/>
    <link rel="alternate" href="https://icc.test/news/9"/>
    <summary>Latest movers</summary>
    <updated>2024-11-02T10:00:00Z</updated>
  </entry>
</feed>)";

  auto Feed = news::parseFeed(Xml);
  REQUIRE(Feed);
  REQUIRE(Feed->Title == "ICC News");
  REQUIRE(Feed->Entries.size() == 1);

  const auto &Entry = Feed->Entries.front();
  REQUIRE(Entry.Link == "https://icc.test/news/9");
  REQUIRE(Entry.Summary == "Latest movers");
  REQUIRE_FALSE(Entry.Published.has_value());

  // Atom entries without a published date fall back to updated.
  auto Item = news::toNewsItem(Entry, "ICC News");
  REQUIRE(Item.Published == "2024-11-02T10:00:00Z");
}

TEST_CASE("Media content is used when no thumbnail exists", "[feed]") {
  constexpr auto Xml = R"(<rss><channel><title>T</title>
    <item><title>A</title>
      <media:content url='https://img.test/a.jpg' />
    </item></channel></rss>)";

  auto Feed = news::parseFeed(Xml);
  REQUIRE(Feed);
  auto Item = news::toNewsItem(Feed->Entries.front(), "T");
  REQUIRE(Item.Image == "https://img.test/a.jpg");
}

TEST_CASE("Feeds without a title and documents that are not feeds", "[feed]") {
  auto Untitled = news::parseFeed("<rss><channel><item><title>x</title></item></channel></rss>");
  REQUIRE(Untitled);
  REQUIRE_FALSE(Untitled->Title.has_value());
  REQUIRE(Untitled->Entries.size() == 1);

  auto Html = news::parseFeed("<html><body>Service unavailable</body></html>");
  REQUIRE_FALSE(Html);
  REQUIRE(Html.error().Status == 500);
}

TEST_CASE("Entity decoding", "[feed]") {
  REQUIRE(news::decodeEntities("a &lt;b&gt; &quot;c&quot; &apos;d&apos;") == R"(a <b> "c" 'd')");
  REQUIRE(news::decodeEntities("caf&#233; &#x2014;") == "caf\xC3\xA9 \xE2\x80\x94");
  REQUIRE(news::decodeEntities("&nbsp;&unknown; & alone") == "&nbsp;&unknown; & alone");
}

TEST_CASE("Markup inside CDATA and comments is not read as elements", "[feed]") {
  constexpr auto Xml = R"(<rss><channel><title>T</title>
    <item>
      <title>A</title>
      <description><![CDATA[<link rel="stylesheet" href="/s.css"> <title>inner</title> body]]></description>
      <!-- <link>https://comment.test/x</link> -->
      <link>https://real.test/a</link>
    </item></channel></rss>)";

  auto Feed = news::parseFeed(Xml);
  REQUIRE(Feed);
  REQUIRE(Feed->Entries.size() == 1);
  const auto &Entry = Feed->Entries.front();
  REQUIRE(Entry.Title == "A");
  REQUIRE(Entry.Link == "https://real.test/a");
  REQUIRE(
      Entry.Summary ==
      R"(<link rel="stylesheet" href="/s.css"> <title>inner</title> body)"
  );
}

TEST_CASE("Tag names appearing as text do not hide later elements", "[feed]") {
  auto Feed = news::parseFeed(
      "<rss><channel><item>title prefix<title>Real</title></item></channel></rss>"
  );
  REQUIRE(Feed);
  REQUIRE(Feed->Entries.size() == 1);
  REQUIRE(Feed->Entries.front().Title == "Real");
}

TEST_CASE("guid stands in for a missing link", "[feed]") {
  constexpr auto Xml = R"(<rss><channel><title>T</title>
    <item><title>Permalink</title><guid>https://news.test/1</guid></item>
    <item><title>Explicit</title><guid isPermaLink="true">https://news.test/2</guid></item>
    <item><title>Opaque</title><guid isPermaLink="false">tag:news.test,3</guid></item>
    <item><title>Both</title><link>https://news.test/4</link><guid>https://news.test/guid/4</guid></item>
  </channel></rss>)";

  auto Feed = news::parseFeed(Xml);
  REQUIRE(Feed);
  REQUIRE(Feed->Entries.size() == 4);
  REQUIRE(Feed->Entries[0].Link == "https://news.test/1");
  REQUIRE(Feed->Entries[1].Link == "https://news.test/2");
  REQUIRE_FALSE(Feed->Entries[2].Link.has_value());
  REQUIRE(Feed->Entries[3].Link == "https://news.test/4");
}
