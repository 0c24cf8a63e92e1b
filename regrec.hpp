#ifndef _REGREC_HPP_
#define _REGREC_HPP_
/*****************************************************************************
  Typed regex records: composable regex templates with structured results

    Register "tokens" (named regex templates, each tied to a record type
    with typed fields), then write patterns like

        "<DATE> <To> <DATE>"

    and get back, instead of a bunch of numbered substrings, the matched
    records: DATE(year=2025, month=12, date=29), with real integers in
    them. Nested records, lists, subtype polymorphism, constants bound in
    the template ("<kind=shipping>"), aliases and fallback values are all
    supported, on top of plain std::regex.

    Quick start:

        using namespace Regrec;
        define({"DATE", R"(<year>-<month>-<date>)", {
            Field("year",  Kind::INTEGER, R"(\d{4})"),
            Field("month", Kind::INTEGER, R"(\d{2})"),
            Field("date",  Kind::INTEGER, R"(\d{2})"),
        }});
        if (auto m = match("due: <DATE>", "due: 2025-12-29"); m) {
            auto d = m->get("DATE").as<Record>();
            d.get<std::int64_t>("year"); // 2025
        }

  NOTE:

  - The regex engine is std::regex (ECMAScript), so: no lookbehind, no
    inline flags, no possessive quantifiers. And it backtracks, so
    pathological templates (nested optional lists of lazy text...) can
    be slow.

  - Registration is not thread-safe; do it upfront. Everything else is.

 *****************************************************************************/

#include "errors.hpp"
#include "value.hpp"
#include "types.hpp"
#include "token.hpp"
#include "groupmap.hpp"
#include "matcher.hpp"
#include "cache.hpp"
#include "registry.hpp"
#include "compiler.hpp"

#endif // _REGREC_HPP_
