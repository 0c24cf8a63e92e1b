#ifndef _REGREC_COMPILER_HPP_
#define _REGREC_COMPILER_HPP_
//---------------------------------------------------------------------------
// Template compiler: template text -> expanded regex + Group-Map (Matcher)
//
//   Placeholders (outside character classes, not escaped):
//
//     <name>          field of the enclosing token, alias, or token
//     <field=value>   binds the field to a constant (no text is consumed);
//                     '\>' stands for '>' in the value
//
//   Anything else starting with '<' (e.g. "a<b", "<3") is literal text, and
//   so is a <name> that is none of the above. An unterminated placeholder
//   is an error only if its name would be expanded (e.g. "x <Num").
//
//   Every expansion is wrapped in a group, so the quantifiers following a
//   placeholder apply to the whole unit. (The ones after a constant are
//   dropped: it has no text to repeat.)
//
//   A compiler is for one compilation; use Registry::compile() instead,
//   which also caches the results.
//---------------------------------------------------------------------------
#include "registry.hpp"
#include "matcher.hpp"
#include "groupmap.hpp"
#include "token.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace Regrec {

class Compiler
{
public:
	static constexpr size_t RECURSION_LIMIT = 100; // Token nesting depth (plenty; cycles are caught anyway)

	explicit Compiler(const Registry& registry, REGEX::flag_type flags = REGEX::ECMAScript);

	Compiler(const Compiler&) = delete;
	Compiler& operator=(const Compiler&) = delete;

	// Throws TemplateSyntaxError, CompileCycleError
	std::shared_ptr<const Matcher> compile(const string& tmpl);

private:
	// The regex text being built, with its running capture group count
	struct Emitter
	{
		string out;
		size_t groups = 0;

		void raw(string_view s) { out += s; }
		void raw(char c) { out += c; }
		size_t capture() { out += '('; return ++groups; } // Opens a capture group; returns its number
	};

	using BINDING_COUNTS = std::map<string, int, std::less<>>; // field name -> number of placeholders binding it

	// Expansion context of a template (or alias, or inlined ancestor template)
	struct Frame
	{
		const TokenDef* token = nullptr;         // whose fields <name> may refer to (nullptr at the top level)
		std::vector<GroupMap>* nodes = nullptr;  // where the bindings (or the top-level roots) go
		const BINDING_COUNTS* bindings = nullptr;
		bool top = false;                        // the user's own template text (user groups are recorded)
	};

	// A field compiled on its own (group numbers starting from 1)
	struct Unit
	{
		GroupMap node;
		string text;
	};

	const Registry& _registry;
	REGEX::flag_type _flags;

	Emitter _main;
	std::vector<string> _in_progress; // tokens & aliases being expanded (for catching cycles)
	std::vector<std::shared_ptr<const TokenDef>> _used;

	// Top-level info
	std::vector<size_t> _user_groups;
	std::vector<Matcher::Element> _elements;

	//-------------------------------------------------------------------
	void _scan(Emitter& e, string_view text, Frame* frame);
	size_t _placeholder(Emitter& e, string_view text, size_t pos, Frame& frame);
	bool _resolves(const string& name, const Frame& frame) const;

	void _field(Emitter& e, const FieldDef& f, Frame& frame);
	void _constant(Emitter& e, const FieldDef& f, string literal, Frame& frame);
	void _alias(Emitter& e, const string& name, const string& fragment, Frame& frame);
	void _inline(Emitter& e, const std::shared_ptr<const TokenDef>& ancestor, Frame& frame);

	GroupMap _token(Emitter& e, const std::shared_ptr<const TokenDef>& def, const FieldDef* field);
	GroupMap _record(Emitter& e, const std::shared_ptr<const TokenDef>& def, const FieldDef* field);
	GroupMap _list(Emitter& e, const FieldDef& f);

	Value _evaluate(const FieldDef& f, const string& literal);
	Unit _subcompile(const FieldDef& f);

	const string* _find_alias(string_view name, const TokenDef* token) const;
	void _count_bindings(const TokenDef& def, string_view text, BINDING_COUNTS& counts, size_t depth) const;
	void _enter(const string& what);
	void _keep(const std::shared_ptr<const TokenDef>& def);
	REGEX _regex(const string& text) const;
};

} // namespace Regrec

#endif // _REGREC_COMPILER_HPP_
