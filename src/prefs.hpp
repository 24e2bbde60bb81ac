#pragma once
#include <Preferences.h>

// Factory-provisioned overrides. The firmware opens this namespace read-only.
static constexpr const char* NVS_NS            = "fox";
static constexpr const char* KEY_MSG_INTERVAL  = "msg_int_s";
static constexpr const char* KEY_PWRUP_HOUR    = "pwr_hour";
static constexpr const char* KEY_PWRUP_MIN     = "pwr_min";
static constexpr const char* KEY_SCHED_START   = "sched_start";
static constexpr const char* KEY_SCHED_STOP    = "sched_stop";
static constexpr const char* KEY_RUN_MINS      = "od_run_min";
static constexpr const char* KEY_RX_MIN_V      = "rx_min_v";
static constexpr const char* KEY_RX_MIN_T      = "rx_min_t";
static constexpr const char* KEY_BATT_MIN_V    = "bat_min_v";
static constexpr const char* KEY_BATT_FACTOR   = "bat_factor";
static constexpr const char* KEY_PTT_LEAD_MS   = "ptt_lead_ms";

#ifndef FW_VERSION
#define FW_VERSION "unknown"
#endif
