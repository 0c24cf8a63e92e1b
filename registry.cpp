#include "registry.hpp"
#include "compiler.hpp"
#include "errors.hpp"
#include "internal.hpp"

#include <algorithm>

namespace Regrec {

//---------------------------------------------------------------------------
const TokenDef& Registry::define(TokenDef def)
{
	if (def.name.empty()) {
		RAISE(Error, "token name must not be empty");
	}
	if (_tokens.find(def.name) != _tokens.end()) {
		RAISE(DuplicateToken, "token '{}' is already registered", def.name);
	}

	const TokenDef* super = nullptr;
	if (!def.supertype.empty()) {
		super = find(def.supertype);
		if (!super) {
			RAISE(InvalidSubtypeLink, "supertype '{}' of '{}' is not registered", def.supertype, def.name);
		}
	}

	for (size_t i = 0; i < def.fields.size(); ++i) {
		for (size_t j = i + 1; j < def.fields.size(); ++j) {
			if (def.fields[i].name == def.fields[j].name) {
				RAISE(Error, "token '{}': field '{}' is declared more than once", def.name, def.fields[i].name);
			}
		}
	}

	// Resolve the fields: the inherited ones first (redefinitions replace
	// them in place, inheriting their explicit pattern if they have none),
	// then the new ones
	std::vector<FieldDef> resolved;
	if (super) resolved = super->fields;
	for (auto& f : def.fields) {
		auto it = std::find_if(resolved.begin(), resolved.end(), [&](auto& r) { return r.name == f.name; });
		if (it != resolved.end()) {
			auto inherited_pattern = it->pattern;
			*it = f;
			if (!it->pattern) it->pattern = std::move(inherited_pattern);
		} else {
			resolved.push_back(f);
		}
	}

	for (auto& f : resolved) {
		_check_field(def.name, f, f.type);
	}

	if (def.pattern.empty()) {
		if (resolved.size() != 1) {
			RAISE(TemplateSyntaxError, "token '{}': an empty template is only allowed with exactly one field (it has {})",
				def.name, resolved.size());
		}
		def.pattern = "<" + resolved.front().name + ">";
	}

	def.fields = std::move(resolved);
	auto name = def.name;
	auto stored = std::make_shared<const TokenDef>(std::move(def));
	_tokens.emplace(name, stored);
	_order.push_back(name);
	if (super) _subtypes[super->name].push_back(name);

	_cache.clear(); // The expansions of some cached templates may have changed (e.g. new subtypes)

DBG("Token '{}' registered: \"{}\" ({} field(s){})", name, stored->pattern, stored->fields.size(),
	super ? format(", subtype of '{}'", super->name) : "");
	return *stored;
}

void Registry::_check_field(const string& token, const FieldDef& f, const FieldType& type) const
{
	switch (type.kind) {
	case Kind::TOKEN:
		if (type.token.empty() || !find(type.token)) {
			RAISE(MissingFieldPattern, "token '{}': field '{}' refers to the unregistered token '{}'",
				token, f.name, type.token);
		}
		break;
	case Kind::LIST:
		if (!type.element) {
			RAISE(MissingFieldPattern, "token '{}': list field '{}' has no element type", token, f.name);
		}
		_check_field(token, f, *type.element);
		break;
	default:
		if (f.pattern && f.pattern->empty()) {
			RAISE(MissingFieldPattern, "token '{}': field '{}' has an empty pattern", token, f.name);
		}
	}
}

Registry& Registry::alias(string name, string fragment)
{
	if (name.empty()) {
		RAISE(Error, "alias name must not be empty");
	}
	_aliases[std::move(name)] = std::move(fragment);
	_cache.clear();
	return *this;
}


//---------------------------------------------------------------------------
const TokenDef& Registry::lookup(string_view name) const
{
	if (auto def = find(name); def) return *def;
	RAISE(UnknownToken, "no token named '{}'", name);
}

const TokenDef* Registry::find(string_view name) const
{
	auto it = _tokens.find(name);
	return it == _tokens.end() ? nullptr : it->second.get();
}

std::shared_ptr<const TokenDef> Registry::shared(string_view name) const
{
	auto it = _tokens.find(name);
	return it == _tokens.end() ? nullptr : it->second;
}

const string* Registry::find_alias(string_view name) const
{
	auto it = _aliases.find(name);
	return it == _aliases.end() ? nullptr : &it->second;
}

bool Registry::is_a(string_view token, string_view ancestor) const
{
	for (auto def = find(token); def; def = def->supertype.empty() ? nullptr : find(def->supertype)) {
		if (def->name == ancestor) return true;
	}
	return false;
}

std::vector<string> Registry::ancestry(string_view token) const
{
	std::vector<string> chain;
	for (auto def = find(token); def; def = def->supertype.empty() ? nullptr : find(def->supertype)) {
		chain.push_back(def->name);
	}
	return chain;
}

const std::vector<string>& Registry::subtypes(string_view token) const
{
	static const std::vector<string> none;
	auto it = _subtypes.find(token);
	return it == _subtypes.end() ? none : it->second;
}

std::vector<std::shared_ptr<const TokenDef>> Registry::family(string_view token) const
{
	std::vector<std::shared_ptr<const TokenDef>> members;
	for (auto& name : _order) {
		if (name != token && is_a(name, token)) members.push_back(_tokens.find(name)->second);
	}
	std::stable_sort(members.begin(), members.end(), [&](auto& a, auto& b) {
		return ancestry(a->name).size() > ancestry(b->name).size();
	});
	members.push_back(shared(token));
	return members;
}


//---------------------------------------------------------------------------
std::shared_ptr<const Matcher> Registry::compile(const string& tmpl, REGEX::flag_type flags) const
{
	if (auto cached = _cache.find(tmpl, flags); cached) {
DBG("Cache hit: \"{}\"", DBG_TRIM(tmpl));
		return cached;
	}
	return _cache.insert(tmpl, flags, Compiler(*this, flags).compile(tmpl));
}

std::optional<MatchResult> Registry::match(const string& tmpl, const string& text, REGEX::flag_type flags) const
{
	return compile(tmpl, flags)->match(text);
}

std::optional<MatchResult> Registry::search(const string& tmpl, const string& text, REGEX::flag_type flags) const
{
	return compile(tmpl, flags)->search(text);
}

std::optional<MatchResult> Registry::fullmatch(const string& tmpl, const string& text, REGEX::flag_type flags) const
{
	return compile(tmpl, flags)->fullmatch(text);
}

std::vector<MatchResult> Registry::finditer(const string& tmpl, const string& text, REGEX::flag_type flags) const
{
	return compile(tmpl, flags)->finditer(text);
}

std::vector<Value> Registry::findall(const string& tmpl, const string& text, REGEX::flag_type flags) const
{
	return compile(tmpl, flags)->findall(text);
}

std::vector<string> Registry::split(const string& tmpl, const string& text, size_t maxsplit, REGEX::flag_type flags) const
{
	return compile(tmpl, flags)->split(text, maxsplit);
}

string Registry::sub(const string& tmpl, string_view replacement, const string& text, size_t count, REGEX::flag_type flags) const
{
	return compile(tmpl, flags)->sub(replacement, text, count);
}

std::pair<string, size_t> Registry::subn(const string& tmpl, string_view replacement, const string& text, size_t count, REGEX::flag_type flags) const
{
	return compile(tmpl, flags)->subn(replacement, text, count);
}

Value Registry::construct(string_view token, const string& text) const
{
	return compile("<" + lookup(token).name + ">")->construct(text);
}


//---------------------------------------------------------------------------
Registry& default_registry()
{
	static Registry registry;
	return registry;
}

} // namespace Regrec
