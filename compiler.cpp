#include "compiler.hpp"
#include "reconstruct.hpp"
#include "errors.hpp"
#include "types.hpp"
#include "internal.hpp"

#include <algorithm>
#include <cassert>
#include <cctype>

namespace Regrec {

namespace {

bool is_name_start(char c) { return std::isalpha((unsigned char)c) || c == '_'; }
bool is_name_char(char c)  { return std::isalnum((unsigned char)c) || c == '_'; }

// Length of the regex quantifier at `pos` (e.g. "*", "{2,3}?"), or 0
size_t quantifier_length(string_view text, size_t pos)
{
	if (pos >= text.size()) return 0;

	size_t len = 0;
	if (text[pos] == '*' || text[pos] == '+' || text[pos] == '?') {
		len = 1;
	} else if (text[pos] == '{') {
		auto close = text.find('}', pos);
		if (close == text.npos) return 0;
		auto inner = text.substr(pos + 1, close - pos - 1);
		if (inner.empty() || !std::isdigit((unsigned char)inner[0])
		    || inner.find_first_not_of("0123456789,") != inner.npos) return 0;
		len = close - pos + 1;
	}
	if (len && pos + len < text.size() && text[pos + len] == '?') ++len; // lazy
	return len;
}

string join(const std::vector<string>& items, string_view sep)
{
	string s;
	for (auto& i : items) { if (!s.empty()) s += sep; s += i; }
	return s;
}

} // namespace


//---------------------------------------------------------------------------
Compiler::Compiler(const Registry& registry, REGEX::flag_type flags) :
	_registry(registry),
	_flags(flags)
{
	init(); // The converter table
}

//---------------------------------------------------------------------------
std::shared_ptr<const Matcher> Compiler::compile(const string& tmpl)
{
DBG("Compiling \"{}\"...", tmpl);
	std::vector<GroupMap> roots;
	Frame top;
	top.nodes = &roots;
	top.top = true;

	_scan(_main, tmpl, &top);

	Matcher::Parts parts;
	parts.source = tmpl;
	parts.regex = _regex(_main.out);
	parts.pattern = std::move(_main.out);
	parts.flags = _flags;
	parts.roots = std::move(roots);
	parts.user_groups = std::move(_user_groups);
	parts.elements = std::move(_elements);
	parts.tokens = std::move(_used);

DBG("-> /{}/ ({} groups)", parts.pattern, _main.groups);
	return std::make_shared<Matcher>(std::move(parts));
}


//---------------------------------------------------------------------------
// Copies regex text to the output, keeping track of the capture groups:
// counts them, rewrites the backreferences (which are local to `text`) to
// the absolute group numbers, and (with a frame) expands the placeholders.
//---------------------------------------------------------------------------
void Compiler::_scan(Emitter& e, string_view text, Frame* frame)
{
	std::vector<size_t> local; // local group N -> absolute local[N-1]
	bool in_class = false;

	for (size_t i = 0, n = text.size(); i < n; ) {
		char c = text[i];

		if (c == '\\') {
			if (i + 1 >= n) { e.raw(c); ++i; continue; } // Let the regex engine complain...
			if (!in_class && text[i + 1] >= '1' && text[i + 1] <= '9') {
				size_t j = i + 1, num = 0;
				while (j < n && std::isdigit((unsigned char)text[j])) { num = num * 10 + size_t(text[j] - '0'); ++j; }
				if (num <= local.size()) {
					e.raw(format("\\{}", local[num - 1]));
					i = j;
					continue;
				}
			}
			e.raw(text.substr(i, 2));
			i += 2;
			continue;
		}

		if (in_class) {
			if (c == ']') in_class = false;
			e.raw(c); ++i;
			continue;
		}

		switch (c) {
		case '[':
			in_class = true;
			e.raw(c); ++i;
			if (i < n && text[i] == '^') { e.raw('^'); ++i; }
			continue;

		case '(':
			if (i + 1 < n && text[i + 1] == '?') { // non-capturing or lookaround
				e.raw("(?"); i += 2;
				if (i < n && text[i] == '<') { e.raw('<'); ++i; } // lookbehind syntax, not a placeholder
				continue;
			}
			local.push_back(e.capture());
			if (frame && frame->top) {
				_user_groups.push_back(local.back());
				_elements.push_back({Matcher::Element::GROUP, _user_groups.size()});
			}
			++i;
			continue;

		case '<':
			if (frame) {
				if (auto used = _placeholder(e, text, i, *frame); used) {
					i += used;
					continue;
				}
			}
			break;
		}

		e.raw(c); ++i;
	}
}

//---------------------------------------------------------------------------
// Returns the length of the placeholder at `pos` (including the dropped
// quantifier of a constant), or 0 if there's none (i.e. '<' is literal).
size_t Compiler::_placeholder(Emitter& e, string_view text, size_t pos, Frame& frame)
{
	size_t n = text.size(), j = pos + 1;
	if (j >= n || !is_name_start(text[j])) return 0;
	while (j < n && is_name_char(text[j])) ++j;
	string name(text.substr(pos + 1, j - pos - 1));

	if (j >= n) {
		if (!_resolves(name, frame)) return 0; // e.g. "a<b"
		RAISE(TemplateSyntaxError, "unterminated placeholder \"<{}\" in \"{}\"", name, text);
	}

	//-------------------------------------------------------------------
	// <field=value>
	if (text[j] == '=') {
		string value;
		size_t k = j + 1;
		bool closed = false;
		while (k < n) {
			if (text[k] == '\\' && k + 1 < n) {
				if (text[k + 1] == '>') value += '>';
				else                    value += text.substr(k, 2);
				k += 2;
				continue;
			}
			if (text[k] == '>') { closed = true; ++k; break; }
			value += text[k++];
		}

		const FieldDef* f = frame.token ? frame.token->field(name) : nullptr;
		if (!f) {
DBG("- '<{}=...>': no such field here; kept as literal text", name);
			return 0;
		}
		if (!closed) {
			RAISE(TemplateSyntaxError, "unterminated assignment \"<{}=...\" in \"{}\"", name, text);
		}
		_constant(e, *f, std::move(value), frame);
		return (k - pos) + quantifier_length(text, k);
	}

	if (text[j] != '>') return 0; // e.g. "<a b>"
	size_t len = j + 1 - pos;

	//-------------------------------------------------------------------
	// <name>: field, alias, token -- in this order
	if (frame.token) {
		if (auto f = frame.token->field(name); f) {
			_field(e, *f, frame);
			return len;
		}
	}

	if (auto fragment = _find_alias(name, frame.token); fragment) {
		_alias(e, name, *fragment, frame);
		return len;
	}

	if (auto def = _registry.shared(name); def) {
		if (frame.token && _registry.is_a(frame.token->name, name)) { // itself or an ancestor
			_inline(e, def, frame);
			return len;
		}
		auto node = _token(e, def, nullptr);
		if (frame.top) _elements.push_back({Matcher::Element::TOKEN, frame.nodes->size()});
		frame.nodes->push_back(std::move(node));
		return len;
	}

DBG("- '<{}>' is not a field, alias or token; kept as literal text", name);
	return 0;
}

// Would <name> be expanded here?
bool Compiler::_resolves(const string& name, const Frame& frame) const
{
	return (frame.token && frame.token->field(name))
	    || _find_alias(name, frame.token)
	    || _registry.find(name);
}

//---------------------------------------------------------------------------
void Compiler::_field(Emitter& e, const FieldDef& f, Frame& frame)
{
	switch (f.type.kind) {
	case Kind::TOKEN: {
		//! An explicit pattern of a token field is ignored: the token's template rules.
		auto def = _registry.shared(f.type.token);
		if (!def) {
			RAISE(MissingFieldPattern, "field '{}': token '{}' is not registered", f.name, f.type.token);
		}
		frame.nodes->push_back(_token(e, def, &f));
		break;
	}

	case Kind::LIST:
		frame.nodes->push_back(_list(e, f));
		break;

	default: {
		GroupMap node;
		node.type = GroupMap::FIELD;
		node.field = &f;
		node.group = e.capture();
		_scan(e, f.pattern ? *f.pattern : converter(f.type.kind).pattern, nullptr);
		e.raw(')');
		frame.nodes->push_back(std::move(node));
	}
	}
}

//---------------------------------------------------------------------------
// Constants consume no text. If the field is also bound elsewhere in the
// template (e.g. in another branch of an alternation), a zero-width marker
// group tells whether this binding's branch was the one that matched.
void Compiler::_constant(Emitter& e, const FieldDef& f, string literal, Frame& frame)
{
	GroupMap node;
	node.type = GroupMap::CONSTANT;
	node.field = &f;
	node.value = _evaluate(f, literal);
	node.literal = std::move(literal);

	if (frame.bindings) {
		if (auto it = frame.bindings->find(f.name); it != frame.bindings->end() && it->second > 1) {
			node.marker = e.capture();
			e.raw(')');
		}
	}
DBG("Constant {} = \"{}\" -> {}", f.name, node.literal, to_string(node.value));
	frame.nodes->push_back(std::move(node));
}

// The literal is matched (in full) by the field's own pattern, and
// converted as if captured from the input. If it doesn't fit: None.
Value Compiler::_evaluate(const FieldDef& f, const string& literal)
{
	auto unit = _subcompile(f);
	REGEX rx = _regex(unit.text);

	MATCH m;
	if (!std::regex_match(literal, m, rx)) {
DBG("- Constant \"{}\" doesn't match the pattern of '{}'; it'll be None", literal, f.name);
		return {};
	}
	try {
		return reconstruct(unit.node, m);
	} catch (ReconstructionError& x) {
DBG("- Constant \"{}\" of '{}' can't be converted ({}); it'll be None", literal, f.name, x.what());
		return {};
	}
}

Compiler::Unit Compiler::_subcompile(const FieldDef& f)
{
	Compiler sub(_registry, _flags);
	sub._in_progress = _in_progress;

	std::vector<GroupMap> nodes;
	Frame frame;
	frame.nodes = &nodes;
	sub._field(sub._main, f, frame);
	assert(nodes.size() == 1);

	for (auto& t : sub._used) _keep(t);
	return Unit{std::move(nodes.front()), std::move(sub._main.out)};
}

//---------------------------------------------------------------------------
void Compiler::_alias(Emitter& e, const string& name, const string& fragment, Frame& frame)
{
	_enter("<" + name + ">");
	Frame inner = frame;
	inner.top = false; // Groups of the alias are not user groups
	e.raw("(?:");
	_scan(e, fragment, &inner);
	e.raw(')');
	_in_progress.pop_back();
}

// <Ancestor> inside a descendant's template: the ancestor's template,
// expanded with the fields of the descendant
void Compiler::_inline(Emitter& e, const std::shared_ptr<const TokenDef>& ancestor, Frame& frame)
{
	_enter(ancestor->name);
	_keep(ancestor);
	Frame inner = frame;
	inner.top = false;
	e.raw("(?:");
	_scan(e, ancestor->pattern, &inner);
	e.raw(')');
	_in_progress.pop_back();
}

//---------------------------------------------------------------------------
// A token occurrence: a plain record, or, if the token has subtypes, an
// alternation of all the candidate record types, most specific first.
GroupMap Compiler::_token(Emitter& e, const std::shared_ptr<const TokenDef>& def, const FieldDef* field)
{
	auto family = _registry.family(def->name);
	if (family.size() == 1) return _record(e, def, field);

	_keep(def);
	GroupMap poly;
	poly.type = GroupMap::POLY;
	poly.token = def.get();
	poly.field = field;

	e.raw("(?:");
	for (size_t k = 0; k < family.size(); ++k) {
		if (k) e.raw('|');
		poly.children.push_back(_record(e, family[k], field));
	}
	e.raw(')');

	poly.group = poly.children.front().group;
DBG("Polymorphic '{}': {} candidates", def->name, family.size());
	return poly;
}

GroupMap Compiler::_record(Emitter& e, const std::shared_ptr<const TokenDef>& def, const FieldDef* field)
{
	_enter(def->name);
	_keep(def);

	GroupMap node;
	node.type = GroupMap::RECORD;
	node.token = def.get();
	node.field = field;
	node.ancestry = _registry.ancestry(def->name);

	BINDING_COUNTS counts;
	_count_bindings(*def, def->pattern, counts, 0);

	// (?:()(?:TEMPLATE)): the body is grouped again, or a top-level '|'
	// in the template would leave the marker in its first branch only
	e.raw("(?:");
	node.group = e.capture(); // Zero-width presence marker
	e.raw(")(?:");

	Frame frame;
	frame.token = def.get();
	frame.nodes = &node.children;
	frame.bindings = &counts;
	_scan(e, def->pattern, &frame);

	e.raw("))");

	for (auto& f : def->fields) {
		if (f.optional || f.fallback) continue;
		bool bound = std::any_of(node.children.begin(), node.children.end(),
		                         [&](auto& c) { return c.field == &f; });
		if (!bound) {
			RAISE(TemplateSyntaxError, "the template of '{}' (\"{}\") never binds its required field '{}'",
				def->name, def->pattern, f.name);
		}
	}

	_in_progress.pop_back();
	return node;
}

//---------------------------------------------------------------------------
// (?:()(BODY))  where  BODY = (?: (?:EMPTY)| ITEM (?:SEP ITEM)* )?
//
// The first group is the presence marker, the second the whole segment,
// which is then re-split by the list's own program at reconstruction.
GroupMap Compiler::_list(Emitter& e, const FieldDef& f)
{
	const Repeat rep = f.repeat.value_or(Repeat{});

	auto scan = std::make_shared<ListScan>();
	scan->element.name = f.name;
	scan->element.type = f.type.element ? *f.type.element : FieldType(Kind::TEXT);
	if (scan->element.type.is_primitive()) scan->element.pattern = f.pattern; // The override is for the items

	auto unit = _subcompile(scan->element);
	scan->item = std::move(unit.node);

	const string item = "(?:" + unit.text + ")";
	const string sep = "(?:" + rep.separator + ")";

	// ITEM (?: SEP ( ITEM (?: SEP ITEM )* ) )?
	Emitter p;
	_scan(p, item, nullptr);
	p.raw("(?:");
	_scan(p, sep, nullptr);
	scan->rest = p.capture();
	_scan(p, item, nullptr);
	p.raw("(?:"); _scan(p, sep, nullptr); _scan(p, item, nullptr); p.raw(")*");
	p.raw("))?");
	scan->program = _regex(p.out);
	scan->source = std::move(p.out);
	if (!rep.empty.empty()) scan->empty = _regex(rep.empty);

	GroupMap node;
	node.type = GroupMap::LIST;
	node.field = &f;

	e.raw("(?:");
	node.marker = e.capture();
	e.raw(')');
	node.group = e.capture();
	e.raw("(?:");
	if (!rep.empty.empty()) {
		e.raw("(?:");
		_scan(e, rep.empty, nullptr);
		e.raw(")|");
	}
	_scan(e, item, nullptr);
	e.raw("(?:"); _scan(e, sep, nullptr); _scan(e, item, nullptr); e.raw(")*");
	e.raw(rep.required ? ")" : ")?");
	e.raw("))");

	node.scan = std::move(scan);
DBG("List '{}' of {}: re-scan /{}/", f.name, f.type.name(), node.scan->source);
	return node;
}

//---------------------------------------------------------------------------
const string* Compiler::_find_alias(string_view name, const TokenDef* token) const
{
	if (token) {
		if (auto it = token->aliases.find(name); it != token->aliases.end()) return &it->second;
	}
	return _registry.find_alias(name);
}

// Pre-scan of a token's template (through its aliases and inlined
// ancestors) for the number of placeholders binding each field
void Compiler::_count_bindings(const TokenDef& def, string_view text, BINDING_COUNTS& counts, size_t depth) const
{
	if (depth > RECURSION_LIMIT) return; // The expansion will report the cycle

	for (size_t i = 0, n = text.size(); i < n; ++i) {
		if (text[i] == '\\') { ++i; continue; }
		if (text[i] != '<') continue;

		size_t j = i + 1;
		if (j >= n || !is_name_start(text[j])) continue;
		while (j < n && is_name_char(text[j])) ++j;
		if (j >= n || (text[j] != '>' && text[j] != '=')) continue;

		auto name = text.substr(i + 1, j - i - 1);
		if (def.field(name)) {
			++counts[string(name)];
		} else if (auto fragment = _find_alias(name, &def); fragment) {
			_count_bindings(def, *fragment, counts, depth + 1);
		} else if (name != def.name && _registry.is_a(def.name, name)) {
			_count_bindings(def, _registry.lookup(name).pattern, counts, depth + 1);
		}
		i = j;
	}
}

void Compiler::_enter(const string& what)
{
	if (std::find(_in_progress.begin(), _in_progress.end(), what) != _in_progress.end()) {
		RAISE(CompileCycleError, "cyclic reference: {} -> {}", join(_in_progress, " -> "), what);
	}
	if (_in_progress.size() >= RECURSION_LIMIT) {
		RAISE(CompileCycleError, "nesting level {} is too deep (at {})", RECURSION_LIMIT, what);
	}
	_in_progress.push_back(what);
}

void Compiler::_keep(const std::shared_ptr<const TokenDef>& def)
{
	if (std::find(_used.begin(), _used.end(), def) == _used.end()) _used.push_back(def);
}

REGEX Compiler::_regex(const string& text) const
{
	try {
		return REGEX(text, _flags);
	} catch (std::regex_error& x) {
		RAISE(TemplateSyntaxError, "invalid regex /{}/: {}", text, x.what());
	}
}

} // namespace Regrec
