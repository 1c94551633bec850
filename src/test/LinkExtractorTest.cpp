#undef NDEBUG
#include <cassert>
#include <iostream>

#include "domain/LinkExtractor.hpp"

using bundlesync::domain::LinkExtractor;

static void TestIdentifierShapes() {
    auto pathStyle = LinkExtractor::ExtractIdentifier("https://drive.google.com/file/d/1AbC_d-9/view?usp=sharing");
    assert(pathStyle && *pathStyle == "1AbC_d-9" && "path-style link");

    auto queryStyle = LinkExtractor::ExtractIdentifier("https://drive.google.com/uc?export=download&id=XyZ_123");
    assert(queryStyle && *queryStyle == "XyZ_123" && "query-style link");

    auto openStyle = LinkExtractor::ExtractIdentifier("https://drive.google.com/open?id=open-ID_7");
    assert(openStyle && *openStyle == "open-ID_7" && "open-style link");

    assert(!LinkExtractor::ExtractIdentifier("https://example.com/downloads/package.zip") && "unrelated URL");
    assert(!LinkExtractor::ExtractIdentifier("") && "empty input");
}

static void TestPathStyleWinsOverQuery() {
    auto id = LinkExtractor::ExtractIdentifier("https://drive.google.com/file/d/PATHID/view?id=QUERYID");
    assert(id && *id == "PATHID");
}

static void TestUrlBuilders() {
    assert(LinkExtractor::BuildDirectUrl("abc") == "https://drive.google.com/uc?export=download&id=abc");
    assert(LinkExtractor::BuildShareLink("abc") == "https://drive.google.com/file/d/abc/view?usp=sharing");

    auto roundTrip = LinkExtractor::ExtractIdentifier(LinkExtractor::BuildShareLink("r0und-Trip"));
    assert(roundTrip && *roundTrip == "r0und-Trip");
}

static void TestFindFirstRemoteLink() {
    std::string text =
        "Download the necessary file(s) from the following link:\n\n"
        "https://drive.google.com/file/d/FIRST/view?usp=sharing\n"
        "Mirror: https://drive.google.com/file/d/SECOND/view\n";
    auto link = LinkExtractor::FindFirstRemoteLink(text);
    assert(link && *link == "https://drive.google.com/file/d/FIRST/view?usp=sharing" && "first link, up to whitespace");

    assert(!LinkExtractor::FindFirstRemoteLink("See https://example.com/file/d/abc for details") && "other hosts ignored");
    assert(!LinkExtractor::FindFirstRemoteLink("No link yet. Export with Unity first.") && "no link");
}

int main() {
    std::cout << "[Test] LinkExtractor..." << std::endl;
    TestIdentifierShapes();
    TestPathStyleWinsOverQuery();
    TestUrlBuilders();
    TestFindFirstRemoteLink();
    std::cout << "[PASS] LinkExtractor" << std::endl;
    return 0;
}
