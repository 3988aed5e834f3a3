#pragma once

#include "yeelight/cancel.h"
#include "yeelight/client.h"
#include "yeelight/command.h"
#include "yeelight/control_session.h"
#include "yeelight/device.h"
#include "yeelight/discovery.h"
#include "yeelight/error.h"
#include "yeelight/events.h"
#include "yeelight/registry.h"
#include "yeelight/storage.h"
#include "yeelight/supervisor.h"
#include "yeelight/sync_coordinator.h"
