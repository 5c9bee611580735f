// Jackson Coxson

#ifndef USBMUX_CPP
#define USBMUX_CPP

#include <usbmux++/deadline.hpp>
#include <usbmux++/device_connector.hpp>
#include <usbmux++/device_registry.hpp>
#include <usbmux++/error.hpp>
#include <usbmux++/frame_codec.hpp>
#include <usbmux++/logging.hpp>
#include <usbmux++/mux_addr.hpp>
#include <usbmux++/option.hpp>
#include <usbmux++/plist_dict.hpp>
#include <usbmux++/protocol_switcher.hpp>
#include <usbmux++/result.hpp>
#include <usbmux++/transport.hpp>
#include <usbmux++/usbmux.hpp>

#endif
