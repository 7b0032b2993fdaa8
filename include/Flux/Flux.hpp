#pragma once

// Flux ECS - archetype entity/component store, queries, commands and systems
// This header includes all Flux headers in dependency order

// Core headers - fundamental types and utilities
#include "Core/Platform.hpp"
#include "Core/Base.hpp"
#include "Core/Config.hpp"
#include "Core/Error.hpp"
#include "Core/Result.hpp"
#include "Core/Log.hpp"
#include "Core/Profile.hpp"
#include "Core/TypeID.hpp"

// Memory regions and tracked allocation
#include "Memory/Region.hpp"
#include "Memory/Memory.hpp"

// Entity system
#include "Entity/Entity.hpp"
#include "Entity/EntityAllocator.hpp"

// Component system
#include "Component/Component.hpp"
#include "Component/ComponentRegistry.hpp"
#include "Component/Bundle.hpp"

// Archetype storage
#include "Archetype/ArchetypeID.hpp"
#include "Archetype/Signature.hpp"
#include "Archetype/Column.hpp"
#include "Archetype/Archetype.hpp"
#include "Archetype/ArchetypeGraph.hpp"
#include "Archetype/ArchetypeStore.hpp"

// Queries
#include "Query/Access.hpp"
#include "Query/QueryData.hpp"
#include "Query/Query.hpp"

// Commands
#include "Commands/Command.hpp"
#include "Commands/CommandQueue.hpp"
#include "Commands/Commands.hpp"

// World, systems and schedules
#include "World/Resources.hpp"
#include "World/WorldConfig.hpp"
#include "System/System.hpp"
#include "System/SystemAccess.hpp"
#include "Schedule/Schedule.hpp"
#include "World/World.hpp"
#include "System/SystemParam.hpp"
#include "System/FunctionSystem.hpp"
