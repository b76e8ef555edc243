/**
 * @file prefetch.hpp
 * @author Ruan Formigoni
 * @brief Filesystem prefetch settings shared by both daemon kinds
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include "../db/db.hpp"
#include "field.hpp"

namespace ns_daemonconfig::ns_prefetch
{

struct FsPrefetch
{
  bool enable = false;
  bool prefetch_all = false;
  int threads_count = 0;
  int merging_size = 0;
  int bandwidth_rate = 0;
};

inline ns_field::Fields fields(FsPrefetch const& prefetch)
{
  using namespace ns_field;
  return {
      make("enable", prefetch.enable)
    , make("prefetch_all", prefetch.prefetch_all)
    , make("threads_count", prefetch.threads_count)
    , make("merging_size", prefetch.merging_size)
    , make("bandwidth_rate", prefetch.bandwidth_rate)
  };
}

[[nodiscard]] inline Value<FsPrefetch> deserialize(ns_db::Db const& db)
{
  FsPrefetch prefetch;
  prefetch.enable = Pop(db.value_or("enable", false));
  prefetch.prefetch_all = Pop(db.value_or("prefetch_all", false));
  prefetch.threads_count = Pop(db.value_or("threads_count", 0));
  prefetch.merging_size = Pop(db.value_or("merging_size", 0));
  prefetch.bandwidth_rate = Pop(db.value_or("bandwidth_rate", 0));
  return prefetch;
}

} // namespace ns_daemonconfig::ns_prefetch

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
