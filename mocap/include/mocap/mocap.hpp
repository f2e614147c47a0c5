#pragma once

// Convenience header for the whole library
#include "mocap/analysis.hpp"
#include "mocap/bvh.hpp"
#include "mocap/capture.hpp"
#include "mocap/clock.hpp"
#include "mocap/config.hpp"
#include "mocap/error.hpp"
#include "mocap/frame_slot.hpp"
#include "mocap/kinematics.hpp"
#include "mocap/log.hpp"
#include "mocap/pose.hpp"
#include "mocap/recorder.hpp"
#include "mocap/replay_source.hpp"
#include "mocap/rig.hpp"
#include "mocap/rotation.hpp"
#include "mocap/session.hpp"
#include "mocap/skeleton.hpp"
#include "mocap/source.hpp"
#include "mocap/stream_monitor.hpp"
