#include "catalog/Listing.hpp"
#include "error/Errors.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cstring>
#include <exception>
#include <limits>
#include <libxml/HTMLparser.h>
#include <libxml/parser.h>

using namespace pawup::catalog;
using namespace pawup::logging;

namespace {

struct ListingState {
    std::vector<DirectoryItem> items;
    htmlParserCtxtPtr ctxt = nullptr;
    std::exception_ptr error;
};

// Autoindex pages are rarely valid HTML; parser diagnostics are noise here.
void silence(void*, const char*, ...) {}

void onStartElement(void* userData, const xmlChar* name, const xmlChar** attrs) {
    auto* state = static_cast<ListingState*>(userData);
    if (state->error || !name || xmlStrcasecmp(name, BAD_CAST "a") != 0 || !attrs) return;

    for (const xmlChar** a = attrs; a[0]; a += 2) {
        if (xmlStrcasecmp(a[0], BAD_CAST "href") != 0 || !a[1]) continue;
        try {
            state->items.push_back(DirectoryItem::fromHref(reinterpret_cast<const char*>(a[1])));
        } catch (...) {
            // Rethrown by parseListing once libxml2 has unwound.
            state->error = std::current_exception();
            xmlStopParser(state->ctxt);
        }
        return;
    }
}

}

DirectoryItem DirectoryItem::fromHref(std::string href) {
    const auto kind = !href.empty() && href.back() == '/' ? Kind::Directory : Kind::File;
    return {kind, std::move(href)};
}

std::vector<DirectoryItem> pawup::catalog::parseListing(const std::string_view html) {
    ListingState state;

    htmlSAXHandler sax;
    std::memset(&sax, 0, sizeof(sax));
    sax.startElement = onStartElement;
    sax.error = silence;
    sax.warning = silence;

    state.ctxt = htmlCreatePushParserCtxt(&sax, &state, nullptr, 0, nullptr, XML_CHAR_ENCODING_UTF8);
    if (!state.ctxt) throw pawup::error::FormatError("couldn't create HTML parser for directory listing");
    htmlCtxtUseOptions(state.ctxt, HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING |
                                   HTML_PARSE_NONET);

    constexpr size_t chunk = static_cast<size_t>(std::numeric_limits<int>::max());
    std::string_view rest = html;
    while (!rest.empty() && !state.error) {
        const auto n = std::min(rest.size(), chunk);
        htmlParseChunk(state.ctxt, rest.data(), static_cast<int>(n), 0);
        rest.remove_prefix(n);
    }
    if (!state.error) htmlParseChunk(state.ctxt, nullptr, 0, 1);

    htmlFreeParserCtxt(state.ctxt);
    if (state.error) std::rethrow_exception(state.error);

    LogRegistry::catalog()->trace("[Listing] Parsed {} anchors from {} bytes", state.items.size(), html.size());
    return std::move(state.items);
}
