#pragma once

#include "cachekit/api/cancellation.hpp"
#include "cachekit/api/factory.hpp"
#include "cachekit/api/lifecycle.hpp"
#include "cachekit/api/status.hpp"
#include "cachekit/api/version.hpp"
#include "cachekit/cache/cache_change.hpp"
#include "cachekit/cache/cache_types.hpp"
#include "cachekit/cache/cached_element.hpp"
#include "cachekit/cache/expiration_scheduler.hpp"
#include "cachekit/cache/notification_gate.hpp"
#include "cachekit/cache/observable_cache.hpp"
#include "cachekit/cache/observable_dictionary.hpp"
#include "cachekit/config/cache_config.hpp"
#include "cachekit/json/i_json.hpp"
#include "cachekit/log/ilog_manager.hpp"
#include "cachekit/log/log_types.hpp"
#include "cachekit/memory/pool.hpp"
#include "cachekit/reactive/observable.hpp"
#include "cachekit/reactive/subject.hpp"
#include "cachekit/task/iexecutor.hpp"
#include "cachekit/task/serial_executor.hpp"
#include "cachekit/threading/async_reader_writer_lock.hpp"
