// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef DDC_HPP
#define DDC_HPP

#include <memory>
#include <vector>
#include <string>
#include <ddcutil_c_api.h>
#include <ddcutil_macros.h>
#include <ddcutil_status_codes.h>

#include <sunbrightd/monitor.hpp>

namespace ddc {

template <class T, auto fn>
struct deleter {
	void operator()(T *ptr) { fn(ptr); }
};

class display {
    DDCA_Display_Handle handle_;
public:
    display(DDCA_Display_Ref ref);
    ~display();
    display(display &&o);
    DDCA_Non_Table_Vcp_Value get_brightness_vcp() const;
    void set_brightness_vcp(uint16_t val);
};

// Monitors reachable over DDC/CI. Construction does no I/O, the displays
// are detected by the first monitors() call.
class bus : public sunbrightd::monitor_bus {
    std::unique_ptr<DDCA_Display_Info_List, deleter<DDCA_Display_Info_List, ddca_free_display_info_list>> list_;
    std::vector<sunbrightd::monitor_identity> monitors_;

    DDCA_Display_Ref ref(const sunbrightd::monitor_identity &monitor) const;
public:
    bus();
    std::vector<sunbrightd::monitor_identity> monitors() override;
    bool set_brightness(const sunbrightd::monitor_identity &monitor, double percentage) override;
};

} // namespace ddc

#endif // DDC_HPP
