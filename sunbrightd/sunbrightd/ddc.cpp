// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <cmath>
#include <span>
#include <vector>
#include <string>
#include <ddcutil_c_api.h>
#include <ddcutil_macros.h>
#include <ddcutil_status_codes.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <sunbrightd/constants.hpp>
#include <sunbrightd/errors.hpp>
#include <sunbrightd/ddc.hpp>

using sunbrightd::device_error;
using sunbrightd::monitor_identity;

namespace ddc {
static constexpr DDCA_Vcp_Feature_Code brightness_code = 0x10;
}

ddc::display::display(DDCA_Display_Ref ref) {
    const DDCA_Status st = ddca_open_display2(ref, true, &handle_);
    if (st != DDCRC_OK) {
        throw device_error(fmt::format("ddca_open_display2 error {} ({})", st, ddca_rc_desc(st)));
    }
}

ddc::display::display(ddc::display &&o) : handle_(o.handle_) {
    o.handle_ = nullptr;
}

ddc::display::~display() {
    if (handle_)
        ddca_close_display(handle_);
}

DDCA_Non_Table_Vcp_Value ddc::display::get_brightness_vcp() const {
    DDCA_Non_Table_Vcp_Value val;
    const DDCA_Status st = ddca_get_non_table_vcp_value(handle_, ddc::brightness_code, &val);
    if (st != DDCRC_OK) {
        throw device_error(fmt::format("ddca_get_non_table_vcp_value error {} ({})", st, ddca_rc_desc(st)));
    }
    return val;
}

void ddc::display::set_brightness_vcp(uint16_t val) {
    const DDCA_Status st = ddca_set_non_table_vcp_value(handle_, ddc::brightness_code, val >> 8, val & 0xFF);
    if (st != DDCRC_OK) {
        throw device_error(fmt::format("ddca_set_non_table_vcp_value error {} ({})", st, ddca_rc_desc(st)));
    }
}

ddc::bus::bus() = default;

// Detection talks to every display, so it is done on the first call,
// from inside a pass.
std::vector<monitor_identity> ddc::bus::monitors() {
    if (list_) {
        return monitors_;
    }

    DDCA_Display_Info_List *list = nullptr;
    const DDCA_Status st = ddca_get_display_info_list2(false, &list);
    list_.reset(list);
    if (st != DDCRC_OK) {
        list_.reset();
        throw device_error(fmt::format("ddca_get_display_info_list2 error {} ({})", st, ddca_rc_desc(st)));
    }

    for (const auto &info : std::span(list_->info, list_->ct)) {
        spdlog::info("[ddc] found: display {}: {}-{}-{}", info.dispno, info.mfg_id, info.model_name, info.sn);
        monitors_.push_back({info.model_name, info.sn, info.dispno});
    }

    if (monitors_.empty()) {
        spdlog::warn("[ddc] no DDC displays found. i2c-dev module not loaded?");
    }

    return monitors_;
}

DDCA_Display_Ref ddc::bus::ref(const monitor_identity &monitor) const {
    if (!list_) {
        throw device_error(fmt::format("display {} ({}) was never detected", monitor.display, monitor.serial));
    }
    for (const auto &info : std::span(list_->info, list_->ct)) {
        if (info.dispno == monitor.display)
            return info.dref;
    }
    throw device_error(fmt::format("display {} ({}) is not connected", monitor.display, monitor.serial));
}

bool ddc::bus::set_brightness(const monitor_identity &monitor, double percentage) {
    using namespace sunbrightd::constants;

    ddc::display dsp(ref(monitor));

    const DDCA_Non_Table_Vcp_Value vcp = dsp.get_brightness_vcp();
    const uint16_t max = vcp.mh << 8 | vcp.ml;
    const uint16_t cur = vcp.sh << 8 | vcp.sl;
    if (max == 0) {
        throw device_error(fmt::format("display {} reports a maximum brightness of 0", monitor.display));
    }

    const int percent = std::clamp(int(std::lround(percentage)), brightness_min, brightness_max);
    const uint16_t out_val = uint16_t(std::lround(double(percent - brightness_min) / (brightness_max - brightness_min) * max));

    if (out_val == cur) {
        spdlog::debug("[ddc] display {}: brightness already {}/{}", monitor.display, cur, max);
        return false;
    }

    spdlog::debug("[ddc] display {}: setting brightness {}/{} (was {})", monitor.display, out_val, max, cur);
    dsp.set_brightness_vcp(out_val);
    return true;
}
