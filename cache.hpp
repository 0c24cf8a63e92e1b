#ifndef _REGREC_CACHE_HPP_
#define _REGREC_CACHE_HPP_
//---------------------------------------------------------------------------
// Compiled-template cache: (template, flags) -> Matcher
//
//   Safe for concurrent use. Compilation itself is not serialized: two
//   threads may compile the same template at the same time, and then the
//   first one stored wins (the results are equivalent anyway).
//---------------------------------------------------------------------------
#include "matcher.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility> // pair

namespace Regrec {

class PatternCache
{
public:
	using KEY = std::pair<string, unsigned>; // template, flags

	std::shared_ptr<const Matcher> find(const string& tmpl, REGEX::flag_type flags) const
	{
		std::lock_guard lock(_lock);
		auto it = _entries.find(KEY{tmpl, unsigned(flags)});
		return it == _entries.end() ? nullptr : it->second;
	}

	// Returns the entry actually kept (which is `compiled`, unless another
	// thread got there first)
	std::shared_ptr<const Matcher> insert(const string& tmpl, REGEX::flag_type flags,
	                                      std::shared_ptr<const Matcher> compiled)
	{
		std::lock_guard lock(_lock);
		return _entries.emplace(KEY{tmpl, unsigned(flags)}, std::move(compiled)).first->second;
	}

	void clear()
	{
		std::lock_guard lock(_lock);
		_entries.clear();
	}

	size_t size() const
	{
		std::lock_guard lock(_lock);
		return _entries.size();
	}

private:
	mutable std::mutex _lock;
	std::map<KEY, std::shared_ptr<const Matcher>> _entries;
};

} // namespace Regrec

#endif // _REGREC_CACHE_HPP_
