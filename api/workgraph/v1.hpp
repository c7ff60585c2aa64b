#pragma once

#include "workgraph/core/v1/types.pb.h"

#include "workgraph/analytics/v1/analytics.pb.h"

#include "workgraph/services/v1/admin_service.pb.h"
#include "workgraph/services/v1/analytics_service.pb.h"
#include "workgraph/services/v1/work_item_service.pb.h"

namespace workgraph::v1 {
using namespace ::workgraph::core::v1;
using namespace ::workgraph::analytics::v1;
using namespace ::workgraph::services::v1;
}
