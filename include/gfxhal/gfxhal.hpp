#pragma once

// Umbrella header.

#include <gfxhal/barrier.hpp>
#include <gfxhal/command.hpp>
#include <gfxhal/commands.hpp>
#include <gfxhal/descriptor.hpp>
#include <gfxhal/descriptor_set.hpp>
#include <gfxhal/device.hpp>
#include <gfxhal/error.hpp>
#include <gfxhal/format.hpp>
#include <gfxhal/garbage.hpp>
#include <gfxhal/handle.hpp>
#include <gfxhal/memory.hpp>
#include <gfxhal/native.hpp>
#include <gfxhal/pass_planner.hpp>
#include <gfxhal/pipeline.hpp>
#include <gfxhal/pipeline_desc.hpp>
#include <gfxhal/pipeline_layout.hpp>
#include <gfxhal/queue.hpp>
#include <gfxhal/range_allocator.hpp>
#include <gfxhal/register_allocator.hpp>
#include <gfxhal/registers/assignment.hpp>
#include <gfxhal/render_pass.hpp>
#include <gfxhal/resource.hpp>
#include <gfxhal/resource_desc.hpp>
#include <gfxhal/result.hpp>
#include <gfxhal/sync.hpp>
#include <gfxhal/types.hpp>
