#ifndef _REGREC_REGISTRY_HPP_
#define _REGREC_REGISTRY_HPP_
//---------------------------------------------------------------------------
// Token registry
//
//   Owns the token definitions (with their fields resolved against the
//   supertypes at registration time), the subtype links, the registry-level
//   aliases, and the cache of the templates compiled against it.
//
//   Registration is expected to happen upfront (it's not synchronized);
//   compiling & matching are then safe from any number of threads.
//---------------------------------------------------------------------------
#include "token.hpp"
#include "matcher.hpp"
#include "cache.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility> // pair
#include <vector>

namespace Regrec {

class Registry
{
public:
	Registry() = default;
	Registry(const Registry&) = delete;
	Registry& operator=(const Registry&) = delete;

	//-------------------------------------------------------------------
	// Registration...

	// Validates & stores the token; returns the stored (resolved) definition.
	// Throws DuplicateToken, InvalidSubtypeLink, MissingFieldPattern,
	// TemplateSyntaxError (empty template with more than one field) or
	// Error (empty name, duplicate field names).
	const TokenDef& define(TokenDef def);

	// Registry-level alias: <name> in any template expands to `fragment`
	// (unless shadowed by a field or a token-level alias of the same name)
	Registry& alias(string name, string fragment);

	//-------------------------------------------------------------------
	// Queries...
	const TokenDef& lookup(string_view name) const; // throws UnknownToken
	const TokenDef* find(string_view name) const;   // nullptr if unknown
	std::shared_ptr<const TokenDef> shared(string_view name) const; // nullptr if unknown
	const string* find_alias(string_view name) const;

	bool is_a(string_view token, string_view ancestor) const; // reflexive
	std::vector<string> ancestry(string_view token) const;     // token, supertype, ... root
	const std::vector<string>& subtypes(string_view token) const; // direct ones, in registration order

	// The token and all its (transitive) subtypes, most specific first:
	// deeper ones before shallower ones, ties in registration order; the
	// token itself is always the last.
	std::vector<std::shared_ptr<const TokenDef>> family(string_view token) const;

	size_t size() const { return _order.size(); }
	const std::vector<string>& names() const { return _order; } // registration order

	//-------------------------------------------------------------------
	// Compiling & matching (cached)...
	std::shared_ptr<const Matcher> compile(const string& tmpl, REGEX::flag_type flags = REGEX::ECMAScript) const;

	std::optional<MatchResult> match(const string& tmpl, const string& text, REGEX::flag_type flags = REGEX::ECMAScript) const;
	std::optional<MatchResult> search(const string& tmpl, const string& text, REGEX::flag_type flags = REGEX::ECMAScript) const;
	std::optional<MatchResult> fullmatch(const string& tmpl, const string& text, REGEX::flag_type flags = REGEX::ECMAScript) const;
	std::vector<MatchResult> finditer(const string& tmpl, const string& text, REGEX::flag_type flags = REGEX::ECMAScript) const;
	std::vector<Value> findall(const string& tmpl, const string& text, REGEX::flag_type flags = REGEX::ECMAScript) const;
	std::vector<string> split(const string& tmpl, const string& text, size_t maxsplit = 0, REGEX::flag_type flags = REGEX::ECMAScript) const;
	string sub(const string& tmpl, string_view replacement, const string& text, size_t count = 0, REGEX::flag_type flags = REGEX::ECMAScript) const;
	std::pair<string, size_t> subn(const string& tmpl, string_view replacement, const string& text, size_t count = 0, REGEX::flag_type flags = REGEX::ECMAScript) const;

	// Matches `text` with "<token>" (from its start), and reconstructs it
	// (None if no match). Throws UnknownToken.
	Value construct(string_view token, const string& text) const;

	const PatternCache& cache() const { return _cache; }

private:
	std::map<string, std::shared_ptr<const TokenDef>, std::less<>> _tokens;
	std::vector<string> _order;
	std::map<string, std::vector<string>, std::less<>> _subtypes;
	ALIAS_MAP _aliases;
	mutable PatternCache _cache;

	void _check_field(const string& token, const FieldDef& f, const FieldType& type) const;
};

// The process-wide registry of the free functions below
Registry& default_registry();

	inline const TokenDef& define(TokenDef def) { return default_registry().define(std::move(def)); }
	inline std::shared_ptr<const Matcher> compile(const string& tmpl, REGEX::flag_type flags = REGEX::ECMAScript) {
		return default_registry().compile(tmpl, flags);
	}
	inline std::optional<MatchResult> match(const string& tmpl, const string& text, REGEX::flag_type flags = REGEX::ECMAScript) {
		return default_registry().match(tmpl, text, flags);
	}
	inline std::optional<MatchResult> search(const string& tmpl, const string& text, REGEX::flag_type flags = REGEX::ECMAScript) {
		return default_registry().search(tmpl, text, flags);
	}
	inline std::optional<MatchResult> fullmatch(const string& tmpl, const string& text, REGEX::flag_type flags = REGEX::ECMAScript) {
		return default_registry().fullmatch(tmpl, text, flags);
	}
	inline std::vector<Value> findall(const string& tmpl, const string& text, REGEX::flag_type flags = REGEX::ECMAScript) {
		return default_registry().findall(tmpl, text, flags);
	}
	inline std::vector<MatchResult> finditer(const string& tmpl, const string& text, REGEX::flag_type flags = REGEX::ECMAScript) {
		return default_registry().finditer(tmpl, text, flags);
	}
	inline std::vector<string> split(const string& tmpl, const string& text, size_t maxsplit = 0, REGEX::flag_type flags = REGEX::ECMAScript) {
		return default_registry().split(tmpl, text, maxsplit, flags);
	}
	inline string sub(const string& tmpl, string_view replacement, const string& text, size_t count = 0, REGEX::flag_type flags = REGEX::ECMAScript) {
		return default_registry().sub(tmpl, replacement, text, count, flags);
	}
	inline std::pair<string, size_t> subn(const string& tmpl, string_view replacement, const string& text, size_t count = 0, REGEX::flag_type flags = REGEX::ECMAScript) {
		return default_registry().subn(tmpl, replacement, text, count, flags);
	}

} // namespace Regrec

#endif // _REGREC_REGISTRY_HPP_
