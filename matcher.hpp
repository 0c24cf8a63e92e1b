#ifndef _REGREC_MATCHER_HPP_
#define _REGREC_MATCHER_HPP_
//---------------------------------------------------------------------------
// Matcher: a compiled template (immutable, shareable across threads)
// MatchResult: one match of it, with typed reconstruction
//
//   Group numbers in the API are the *user* group numbers, i.e. those of the
//   capture groups written literally in the template (1-based, in textual
//   order). The groups generated by the expansion are never exposed.
//---------------------------------------------------------------------------
#include "groupmap.hpp"
#include "token.hpp"
#include "value.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility> // pair
#include <vector>

namespace Regrec {

class MatchResult;

//---------------------------------------------------------------------------
class Matcher : public std::enable_shared_from_this<Matcher>
//---------------------------------------------------------------------------
{
public:
	// Top-level elements of the template, in textual order (for findall())
	struct Element {
		enum { TOKEN, GROUP } kind;
		size_t index; // TOKEN: index into roots(); GROUP: the user group number
	};

	// One occurrence of a record class: the candidate nodes that would
	// yield it (more than one only for polymorphic occurrences)
	struct Slot {
		std::vector<const GroupMap*> alternatives;
	};

	// The Compiler's output
	struct Parts {
		string source;                   // the template, as given
		string pattern;                  // the expanded regex text
		REGEX regex;
		REGEX::flag_type flags = REGEX::ECMAScript;
		std::vector<GroupMap> roots;     // top-level token occurrences, in textual order
		std::vector<size_t> user_groups; // user group N -> absolute group user_groups[N-1]
		std::vector<Element> elements;
		std::vector<std::shared_ptr<const TokenDef>> tokens; // keep-alives for the GroupMap pointers
	};

	explicit Matcher(Parts parts);

	Matcher(const Matcher&) = delete;
	Matcher& operator=(const Matcher&) = delete;

	//-------------------------------------------------------------------
	// Matching (the Matcher must be owned by a shared_ptr, as it's
	// referenced by the results)...

	// Anchored at the start of `text` (but not at its end)
	std::optional<MatchResult> match(const string& text) const;
	// First match anywhere
	std::optional<MatchResult> search(const string& text) const;
	// The whole text
	std::optional<MatchResult> fullmatch(const string& text) const;
	// All non-overlapping matches
	std::vector<MatchResult> finditer(const string& text) const;

	// For each match: with a single top-level element (token occurrence
	// or user group), its value; with more, a List of them; with none,
	// the matched text.
	std::vector<Value> findall(const string& text) const;

	// Splits `text` at the matches (at most `maxsplit` of them; 0: all).
	// The user groups of each match are put between the pieces (the ones
	// not taking part as empty strings).
	std::vector<string> split(const string& text, size_t maxsplit = 0) const;

	// Replaces the first `count` matches (0: every match) with `replacement`,
	// where $1..$99 refer to the user groups, $& to the whole match,
	// $` / $' to the prefix / suffix, and $$ is a literal '$'.
	string sub(string_view replacement, const string& text, size_t count = 0) const;
	// Same, plus the number of replacements made
	std::pair<string, size_t> subn(string_view replacement, const string& text, size_t count = 0) const;

	// match() + the reconstruction of the first top-level token occurrence.
	// None if no match. UnknownOccurrence if the template has no tokens.
	Value construct(const string& text) const;

	//-------------------------------------------------------------------
	// Introspection...
	const string& source() const { return _source; }
	const string& pattern() const { return _pattern; }
	const REGEX& regex() const { return _regex; }
	REGEX::flag_type flags() const { return _flags; }
	size_t groups() const { return _user_groups.size(); }
	const std::vector<GroupMap>& roots() const { return _roots; }
	const std::vector<Element>& elements() const { return _elements; }

	// Number of occurrences of a record class (including those of its
	// subtypes, and the polymorphic ones that could yield it)
	size_t occurrences(string_view class_name) const;

	// User group number -> absolute group number; throws std::out_of_range
	size_t actual_group(size_t user_group) const;

	// Throws UnknownOccurrence for unknown classes and out-of-range indexes
	const Slot& slot(string_view class_name, size_t index) const;

private:
	string _source;
	string _pattern;
	REGEX _regex;
	REGEX::flag_type _flags;
	std::vector<GroupMap> _roots;
	std::vector<size_t> _user_groups;
	std::vector<Element> _elements;
	std::vector<std::shared_ptr<const TokenDef>> _tokens;

	std::map<string, std::vector<Slot>, std::less<>> _index; // class name -> occurrences, in textual order

	void _index_node(GroupMap& node);
	MatchResult _result(std::shared_ptr<const string> subject, MATCH m) const;
};


//---------------------------------------------------------------------------
class MatchResult
//---------------------------------------------------------------------------
{
public:
	MatchResult(std::shared_ptr<const Matcher> matcher, std::shared_ptr<const string> subject, MATCH m);

	// The index-th (1-based) occurrence of a record class, reconstructed.
	// None if it didn't take part in the match.
	// Throws UnknownOccurrence, or ReconstructionError.
	Value get(string_view class_name, size_t index = 1) const;

	// User groups (0: the whole match). Non-participating groups are empty
	// (see matched()). Invalid group numbers throw std::out_of_range.
	string group(size_t n = 0) const;
	bool matched(size_t n) const;
	std::vector<std::optional<string>> groups() const; // 1..N

	// Positions are offsets into the subject; string::npos if not participating
	size_t start(size_t n = 0) const;
	size_t end(size_t n = 0) const;
	std::pair<size_t, size_t> span(size_t n = 0) const;

	// Substitutes $n, $&, $`, $', $$ in `fmt` (see Matcher::sub())
	string expand(string_view fmt) const;

	string str() const { return group(0); }

	const MATCH& native() const { return _m; }
	const string& subject() const { return *_subject; }
	const Matcher& matcher() const { return *_matcher; }

private:
	std::shared_ptr<const Matcher> _matcher;
	std::shared_ptr<const string> _subject; // _m points into this
	MATCH _m;

	const MATCH::value_type& _sub(size_t n) const;
};

} // namespace Regrec

#endif // _REGREC_MATCHER_HPP_
