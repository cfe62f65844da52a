#pragma once
#include <map>
#include <vector>
#include <utility>
#include <functional>
#include <type_traits>

/**
 * @file GroupingUtils.h
 * @brief Grouping and folding helpers used to bucket ledger records.
 *
 * Keys are whatever the key function returns (a week bucket, a month bucket,
 * a customer id). Groups are returned in a std::map, so iteration is always
 * in ascending key order and results are reproducible.
 */
namespace ledger
{
  template <class Range>
  using RangeElement = typename std::decay_t<Range>::value_type;

  template <class Fn, class Element>
  using FnResult = std::decay_t<std::invoke_result_t<Fn, const Element&>>;

  /**
   * @brief Elements of items for which the predicate holds, as pointers into items.
   */
  template <class Range, class Predicate>
  std::vector<const RangeElement<Range>*>
  selectWhere(const Range& items, Predicate predicate)
  {
    std::vector<const RangeElement<Range>*> selected;
    for (const auto& item : items)
      {
	if (predicate(item))
	  selected.push_back(&item);
      }
    return selected;
  }

  template <class Range, class KeyFn>
  std::map<FnResult<KeyFn, RangeElement<Range>>, std::vector<RangeElement<Range>>>
  groupBy(const Range& items, KeyFn keyFn)
  {
    std::map<FnResult<KeyFn, RangeElement<Range>>, std::vector<RangeElement<Range>>> groups;
    for (const auto& item : items)
      groups[keyFn(item)].push_back(item);
    return groups;
  }

  /**
   * @brief Left fold of valueFn over items starting from init.
   */
  template <class Range, class Value, class ValueFn>
  Value sumBy(const Range& items, const Value& init, ValueFn valueFn)
  {
    Value total(init);
    for (const auto& item : items)
      total = total + valueFn(item);
    return total;
  }

  /**
   * @brief Per-key total of valueFn, equivalent to groupBy followed by sumBy on each group.
   */
  template <class Range, class KeyFn, class ValueFn>
  std::map<FnResult<KeyFn, RangeElement<Range>>, FnResult<ValueFn, RangeElement<Range>>>
  groupSum(const Range& items, KeyFn keyFn, ValueFn valueFn)
  {
    std::map<FnResult<KeyFn, RangeElement<Range>>, FnResult<ValueFn, RangeElement<Range>>> totals;
    for (const auto& item : items)
      {
	auto key = keyFn(item);
	auto value = valueFn(item);
	auto it = totals.find(key);
	if (it == totals.end())
	  totals.emplace(std::move(key), std::move(value));
	else
	  it->second = it->second + value;
      }
    return totals;
  }

  template <class Range, class KeyFn>
  std::map<FnResult<KeyFn, RangeElement<Range>>, std::size_t>
  groupCount(const Range& items, KeyFn keyFn)
  {
    std::map<FnResult<KeyFn, RangeElement<Range>>, std::size_t> counts;
    for (const auto& item : items)
      ++counts[keyFn(item)];
    return counts;
  }

  /**
   * @brief Group values in ascending key order.
   */
  template <class Key, class Value>
  std::vector<Value> valuesInKeyOrder(const std::map<Key, Value>& groups)
  {
    std::vector<Value> values;
    values.reserve(groups.size());
    for (const auto& entry : groups)
      values.push_back(entry.second);
    return values;
  }

  /**
   * @brief Entry with the largest value; ties go to the smallest key.
   * @return groups.end() when groups is empty.
   */
  template <class Key, class Value>
  typename std::map<Key, Value>::const_iterator
  maxByValue(const std::map<Key, Value>& groups)
  {
    auto best = groups.end();
    for (auto it = groups.begin(); it != groups.end(); ++it)
      {
	if (best == groups.end() || best->second < it->second)
	  best = it;
      }
    return best;
  }
}
