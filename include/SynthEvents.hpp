#pragma once

#include "synthevents/core/Error.hpp"
#include "synthevents/event/DescriptorTable.hpp"
#include "synthevents/event/DispatchConfig.hpp"
#include "synthevents/event/EventClass.hpp"
#include "synthevents/event/EventPool.hpp"
#include "synthevents/event/EventPropagation.hpp"
#include "synthevents/event/FieldValue.hpp"
#include "synthevents/event/NativeEvent.hpp"
#include "synthevents/event/StandardEvents.hpp"
#include "synthevents/event/SyntheticEvent.hpp"
#include "synthevents/batching/BatchingCoordinator.hpp"
#include "synthevents/batching/BatchingStrategy.hpp"
#include "synthevents/batching/ControlledComponents.hpp"
#include "synthevents/io/IoEvents.hpp"
#include "synthevents/io/IoNativeEvents.hpp"
#include "synthevents/runtime/EventRuntime.hpp"
#include "synthevents/runtime/RuntimeOptions.hpp"
#include "synthevents/tools/EventJsonExporter.hpp"
