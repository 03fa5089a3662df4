#pragma once

/**
 * @brief 领域层统一入口
 *
 * 包含领域基础设施与借阅核心的聚合根、策略定义。
 */

// ==================== 基础设施 ====================

#include "DomainEvent.hpp"       // 领域事件定义
#include "EventBus.hpp"          // 事件发布订阅
#include "Aggregate.hpp"         // 聚合根基类

// ==================== 库存模块聚合根 ====================

#include "modules/inventory/domain/Book.hpp"

// ==================== 会员模块聚合根 ====================

#include "modules/member/domain/Member.hpp"

// ==================== 借阅模块 ====================

#include "modules/loan/domain/CirculationPolicy.hpp"
#include "modules/loan/domain/FeeCalculator.hpp"
#include "modules/loan/domain/EligibilityPolicy.hpp"
#include "modules/loan/domain/Loan.hpp"
#include "modules/loan/domain/Events.hpp"
