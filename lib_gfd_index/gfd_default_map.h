#ifndef GFD_DEFAULT_MAP_H
#define GFD_DEFAULT_MAP_H


#include <unordered_map>
#include <utility>


namespace gfd
{


/*
* A hash map which answers lookups of absent keys with a fixed
* default value, given at construction. Unlike `operator[]` on a
* std::unordered_map, reading a missing key never inserts it, so
* read-heavy querying leaves the storage proportional to the keys
* which were explicitly set.
* The default is returned by const reference, so it stays valid
* for as long as the map does.
*/
template<typename K, typename V, typename Hash = std::hash<K>>
class DefaultMap
{
public:
	typedef std::unordered_map<K, V, Hash> Map;
	typedef typename Map::const_iterator const_iterator;

public:
	DefaultMap() :
		m_default()
	{ }

	explicit DefaultMap(V default_value) :
		m_default(std::move(default_value))
	{ }

	const V& get(const K& key) const
	{
		auto iter = m_map.find(key);
		if (iter == m_map.end())
			return m_default;
		else
			return iter->second;
	}

	const V& operator[](const K& key) const
	{
		return get(key);
	}

	void set(K key, V value)
	{
		m_map.insert_or_assign(std::move(key), std::move(value));
	}

	/*
	* Get a mutable reference to the value stored at `key`,
	* storing a copy of the default first if `key` is absent.
	* Used while building, to union into set-valued entries.
	*/
	V& slot(const K& key)
	{
		return m_map.try_emplace(key, m_default).first->second;
	}

	// true iff `key` was explicitly stored (never true merely
	// because the default was returned for it)
	bool contains_key(const K& key) const
	{
		return m_map.find(key) != m_map.end();
	}

	bool erase(const K& key)
	{
		return m_map.erase(key) > 0;
	}

	const V& default_value() const { return m_default; }
	size_t size() const { return m_map.size(); }
	bool empty() const { return m_map.empty(); }
	const_iterator begin() const { return m_map.cbegin(); }
	const_iterator end() const { return m_map.cend(); }

private:
	Map m_map;
	V m_default;
};


}  // namespace gfd


#endif  // GFD_DEFAULT_MAP_H
