#pragma once

#ifdef __cplusplus

#include "log.hpp"
#include "types.hpp"
#include "db.hpp"
#include "date.hpp"
#include "network.hpp"
#include "scheduler.hpp"
#include "auth.hpp"
#include "subscription.hpp"
#include "store.hpp"
#include "delta.hpp"
#include "merge.hpp"
#include "api.hpp"
#include "ddp.hpp"
#include "subscriptions_client.hpp"
#include "sync_client.hpp"

#endif // __cplusplus
