#include "reconstruct.hpp"
#include "errors.hpp"
#include "types.hpp"
#include "internal.hpp"

#include <cassert>

namespace Regrec {

namespace {

Value value_of(const GroupMap& node, const MATCH& m);

//---------------------------------------------------------------------------
Value field_value(const GroupMap& node, const MATCH& m)
{
	if (!node.field) ERROR("FIELD node without a field definition (group {})", node.group);

	auto text = m[node.group].str();
	try {
		return converter(node.field->type.kind).parse(text);
	}
	catch (std::invalid_argument& x) {
		RAISE(ReconstructionError, "field '{}' ({}): \"{}\" matched its pattern, but not its parser ({})",
			node.field->name, node.field->type.name(), text, x.what());
	}
	catch (std::out_of_range& x) {
		RAISE(ReconstructionError, "field '{}' ({}): \"{}\" matched its pattern, but is out of range ({})",
			node.field->name, node.field->type.name(), text, x.what());
	}
}

//---------------------------------------------------------------------------
// The engine only keeps the captures of the last repetition, so the items
// are recovered by re-matching the whole segment, one item at a time.
Value list_value(const GroupMap& node, const MATCH& m)
{
	if (!m[node.marker].matched) return {}; // The segment wasn't there at all

	assert(node.scan);
	const auto& scan = *node.scan;

	List items;
	string rest = m[node.group].str();
	if (rest.empty()) return items;
	if (scan.empty && std::regex_match(rest, *scan.empty)) return items;

	for (;;) {
		MATCH im;
		if (!std::regex_match(rest, im, scan.program)) {
			RAISE(ReconstructionError, "list field '{}': can't re-split \"{}\" with /{}/",
				node.field ? node.field->name : "?", rest, scan.source);
		}
		items.push_back(value_of(scan.item, im));

		if (!im[scan.rest].matched) break;
		string next = im[scan.rest].str();
		if (next.size() >= rest.size()) { // Would loop forever (e.g. empty items & separators)
			RAISE(ReconstructionError, "list field '{}': no progress re-splitting \"{}\"",
				node.field ? node.field->name : "?", rest);
		}
		rest = std::move(next);
	}
DBG("List '{}': {} item(s)", node.field ? node.field->name : "?", items.size());
	return items;
}

//---------------------------------------------------------------------------
Value record_value(const GroupMap& node, const MATCH& m)
{
	assert(node.type == GroupMap::RECORD && node.token);

	Record r;
	r.type = node.token->name;
	for (auto& f : node.token->fields) {
		// Fields can be bound more than once (e.g. in different branches
		// of an alternation): the first one that took part wins.
		const GroupMap* hit = nullptr;
		for (auto& c : node.children) {
			if (c.field == &f && participated(c, m)) { hit = &c; break; }
		}

		Value v;
		if (hit) {
			v = value_of(*hit, m);
		} else if (f.fallback) {
			v = *f.fallback;
		} else if (!f.optional && f.type.kind != Kind::LIST) { // An absent list is just None
			RAISE(ReconstructionError, "{}: required field '{}' did not take part in the match",
				r.type, f.name);
		}
		r.set(f.name, std::move(v));
	}
	return r;
}

Value value_of(const GroupMap& node, const MATCH& m)
{
	switch (node.type) {
	case GroupMap::FIELD:    return field_value(node, m);
	case GroupMap::CONSTANT: return node.value;
	case GroupMap::LIST:     return list_value(node, m);
	case GroupMap::RECORD:   return record_value(node, m);
	case GroupMap::POLY:
		for (auto& alt : node.children) {
			if (participated(alt, m)) return record_value(alt, m);
		}
		return {};
	default:
		ERROR("Invalid Group-Map node type #{}", (int)node.type);
	}
}

} // namespace


//---------------------------------------------------------------------------
bool participated(const GroupMap& node, const MATCH& m)
{
	switch (node.type) {
	case GroupMap::FIELD:    return m[node.group].matched;
	case GroupMap::CONSTANT: return !node.marker || m[node.marker].matched;
	case GroupMap::LIST:     return m[node.marker].matched;
	case GroupMap::RECORD:   return m[node.group].matched;
	case GroupMap::POLY:
		for (auto& alt : node.children) {
			if (participated(alt, m)) return true;
		}
		return false;
	default:
		ERROR("Invalid Group-Map node type #{}", (int)node.type);
	}
}

Value reconstruct(const GroupMap& node, const MATCH& m)
{
	if (!participated(node, m)) return {};
	return value_of(node, m);
}

} // namespace Regrec
