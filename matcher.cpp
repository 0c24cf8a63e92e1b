#include "matcher.hpp"
#include "reconstruct.hpp"
#include "errors.hpp"
#include "internal.hpp"

#include <algorithm>
#include <cassert>
#include <cctype>

namespace Regrec {

//===========================================================================
// Matcher
//===========================================================================
Matcher::Matcher(Parts parts) :
	_source(std::move(parts.source)),
	_pattern(std::move(parts.pattern)),
	_regex(std::move(parts.regex)),
	_flags(parts.flags),
	_roots(std::move(parts.roots)),
	_user_groups(std::move(parts.user_groups)),
	_elements(std::move(parts.elements)),
	_tokens(std::move(parts.tokens))
{
	//! The index points into _roots, so it can only be built once they're
	//! at their final place (and Matcher is not copyable/movable, so they stay).
	for (auto& root : _roots) _index_node(root);

DBG("Matcher for \"{}\": {} root(s), {} user group(s), {} indexed class(es)",
	DBG_TRIM(_source), _roots.size(), _user_groups.size(), _index.size());
#ifndef NDEBUG
DBG_("Occurrences:");
	for (auto& [cls, slots] : _index) cerr << format(" {} x{}", cls, slots.size());
_DBG("");
#endif
}

//---------------------------------------------------------------------------
// Pre-order walk: occurrence numbers follow the textual order of the
// (outermost-first) token occurrences.
void Matcher::_index_node(GroupMap& node)
{
	switch (node.type) {
	case GroupMap::RECORD:
		for (auto& cls : node.ancestry) {
			_index[cls].push_back(Slot{{&node}});
		}
		node.ordinal = _index[node.token->name].size();
		for (auto& c : node.children) _index_node(c);
		break;

	case GroupMap::POLY: {
		// One slot for every class any of the alternatives can yield,
		// holding the alternatives that are that class
		std::vector<string> classes;
		for (auto alt = node.children.rbegin(); alt != node.children.rend(); ++alt) { // base first
			for (auto& cls : alt->ancestry) {
				if (std::find(classes.begin(), classes.end(), cls) == classes.end()) classes.push_back(cls);
			}
		}
		for (auto& cls : classes) {
			Slot slot;
			for (auto& alt : node.children) {
				if (alt.is_a(cls)) slot.alternatives.push_back(&alt);
			}
			_index[cls].push_back(std::move(slot));
		}
		node.ordinal = _index[node.token->name].size();
		for (auto& alt : node.children) {
			alt.ordinal = _index[alt.token->name].size();
			for (auto& c : alt.children) _index_node(c);
		}
		break;
	}

	default: // FIELD, CONSTANT: nothing inside; LIST: its items are not occurrences
		break;
	}
}

//---------------------------------------------------------------------------
size_t Matcher::occurrences(string_view class_name) const
{
	auto it = _index.find(class_name);
	return it == _index.end() ? 0 : it->second.size();
}

const Matcher::Slot& Matcher::slot(string_view class_name, size_t index) const
{
	auto it = _index.find(class_name);
	if (it == _index.end()) {
		RAISE(UnknownOccurrence, "no '{}' occurs in \"{}\"", class_name, _source);
	}
	if (index < 1 || index > it->second.size()) {
		RAISE(UnknownOccurrence, "'{}' #{} is out of range (1..{}) in \"{}\"",
			class_name, index, it->second.size(), _source);
	}
	return it->second[index - 1];
}

size_t Matcher::actual_group(size_t user_group) const
{
	if (user_group == 0) return 0;
	if (user_group > _user_groups.size()) {
		throw std::out_of_range(format("no group {} in \"{}\" (it has {})", user_group, _source, _user_groups.size()));
	}
	return _user_groups[user_group - 1];
}

//---------------------------------------------------------------------------
MatchResult Matcher::_result(std::shared_ptr<const string> subject, MATCH m) const
{
	return MatchResult(shared_from_this(), std::move(subject), std::move(m));
}

std::optional<MatchResult> Matcher::match(const string& text) const
{
	auto subject = std::make_shared<const string>(text);
	MATCH m;
	if (!std::regex_search(subject->cbegin(), subject->cend(), m, _regex, std::regex_constants::match_continuous)) {
		return std::nullopt;
	}
	return _result(std::move(subject), std::move(m));
}

std::optional<MatchResult> Matcher::search(const string& text) const
{
	auto subject = std::make_shared<const string>(text);
	MATCH m;
	if (!std::regex_search(subject->cbegin(), subject->cend(), m, _regex)) {
		return std::nullopt;
	}
	return _result(std::move(subject), std::move(m));
}

std::optional<MatchResult> Matcher::fullmatch(const string& text) const
{
	auto subject = std::make_shared<const string>(text);
	MATCH m;
	if (!std::regex_match(subject->cbegin(), subject->cend(), m, _regex)) {
		return std::nullopt;
	}
	return _result(std::move(subject), std::move(m));
}

std::vector<MatchResult> Matcher::finditer(const string& text) const
{
	auto subject = std::make_shared<const string>(text);
	std::vector<MatchResult> results;
	for (std::sregex_iterator it(subject->cbegin(), subject->cend(), _regex), end; it != end; ++it) {
		results.push_back(_result(subject, *it));
	}
	return results;
}

std::vector<Value> Matcher::findall(const string& text) const
{
	std::vector<Value> values;
	for (auto& r : finditer(text)) {
		if (_elements.empty()) {
			values.push_back(r.group(0));
			continue;
		}
		List row;
		for (auto& el : _elements) {
			if (el.kind == Element::TOKEN) {
				row.push_back(reconstruct(_roots[el.index], r.native()));
			} else {
				row.push_back(r.matched(el.index) ? Value(r.group(el.index)) : Value());
			}
		}
		if (row.size() == 1) values.push_back(std::move(row.front()));
		else                 values.push_back(std::move(row));
	}
	return values;
}

std::vector<string> Matcher::split(const string& text, size_t maxsplit) const
{
	std::vector<string> pieces;
	size_t done = 0, splits = 0;
	for (auto& r : finditer(text)) {
		if (maxsplit && splits == maxsplit) break;
		pieces.push_back(text.substr(done, r.start() - done));
		for (size_t g = 1; g <= groups(); ++g) pieces.push_back(r.group(g));
		done = r.end();
		++splits;
	}
	pieces.push_back(text.substr(done));
	return pieces;
}

std::pair<string, size_t> Matcher::subn(string_view replacement, const string& text, size_t count) const
{
	string out;
	size_t done = 0, replaced = 0;
	for (auto& r : finditer(text)) {
		if (count && replaced == count) break;
		out.append(text, done, r.start() - done);
		out += r.expand(replacement);
		done = r.end();
		++replaced;
	}
	out.append(text, done);
	return {out, replaced};
}

string Matcher::sub(string_view replacement, const string& text, size_t count) const
{
	return subn(replacement, text, count).first;
}

Value Matcher::construct(const string& text) const
{
	if (_roots.empty()) {
		RAISE(UnknownOccurrence, "\"{}\" has no token to construct", _source);
	}
	auto r = match(text);
	if (!r) return {};
	return reconstruct(_roots.front(), r->native());
}


//===========================================================================
// MatchResult
//===========================================================================
MatchResult::MatchResult(std::shared_ptr<const Matcher> matcher, std::shared_ptr<const string> subject, MATCH m) :
	_matcher(std::move(matcher)),
	_subject(std::move(subject)),
	_m(std::move(m))
{
	assert(_matcher);
	assert(_subject);
}

const MATCH::value_type& MatchResult::_sub(size_t n) const
{
	return _m[_matcher->actual_group(n)];
}

Value MatchResult::get(string_view class_name, size_t index) const
{
	for (auto alt : _matcher->slot(class_name, index).alternatives) {
		if (participated(*alt, _m)) return reconstruct(*alt, _m);
	}
	return {};
}

string MatchResult::group(size_t n) const { return _sub(n).str(); }
bool MatchResult::matched(size_t n) const { return _sub(n).matched; }

std::vector<std::optional<string>> MatchResult::groups() const
{
	std::vector<std::optional<string>> result;
	for (size_t n = 1; n <= _matcher->groups(); ++n) {
		if (matched(n)) result.emplace_back(group(n));
		else            result.emplace_back(std::nullopt);
	}
	return result;
}

size_t MatchResult::start(size_t n) const
{
	auto& s = _sub(n);
	return s.matched ? size_t(s.first - _subject->cbegin()) : string::npos;
}

size_t MatchResult::end(size_t n) const
{
	auto& s = _sub(n);
	return s.matched ? size_t(s.second - _subject->cbegin()) : string::npos;
}

std::pair<size_t, size_t> MatchResult::span(size_t n) const
{
	return {start(n), end(n)};
}

string MatchResult::expand(string_view fmt) const
{
	string out;
	for (size_t i = 0; i < fmt.size(); ++i) {
		if (fmt[i] != '$' || i + 1 == fmt.size()) { out += fmt[i]; continue; }

		char c = fmt[i + 1];
		if      (c == '$')  { out += '$'; ++i; }
		else if (c == '&')  { out += group(0); ++i; }
		else if (c == '`')  { out += _m.prefix().str(); ++i; }
		else if (c == '\'') { out += _m.suffix().str(); ++i; }
		else if (std::isdigit((unsigned char)c)) {
			// Two digits only if that's still a valid group
			size_t n = size_t(c - '0'), len = 1;
			if (i + 2 < fmt.size() && std::isdigit((unsigned char)fmt[i + 2])) {
				auto nn = n * 10 + size_t(fmt[i + 2] - '0');
				if (nn <= _matcher->groups()) { n = nn; len = 2; }
			}
			if (n == 0 || n > _matcher->groups()) { out += fmt[i]; continue; } // Not a group ref.; keep it literally
			out += group(n);
			i += len;
		}
		else out += fmt[i];
	}
	return out;
}

} // namespace Regrec
