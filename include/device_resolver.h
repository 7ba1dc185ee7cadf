// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file device_resolver.h
 * @brief Maps the device requirements of a test case to concrete devices
 *
 * Two strategies, picked once at startup:
 * - HilDeviceResolver: reads the device registry and the live hardware on
 *   every call, so boards plugged in or out between tests are noticed.
 * - StaticPortDeviceResolver: serial ports given on the command line, no
 *   power switching.
 */

#include "device.h"
#include "device_registry.h"
#include "test_catalog.h"

#include <string>
#include <vector>

namespace hil {

/// DUT and stub selected for one test; either may be left unconnected
struct ResolvedDevices {
    Device dut;
    Device stub;
};

class DeviceResolver {
  public:
    virtual ~DeviceResolver() = default;

    virtual ResolvedDevices resolve(const TestCase& test) = 0;
};

class HilDeviceResolver : public DeviceResolver {
  public:
    HilDeviceResolver(DeviceRegistry& registry, std::string registry_path, std::string board);

    /**
     * @brief Pick devices for @p test
     *
     * The DUT is the first connected registry device matching a DUT
     * requirement (same name, version tag present in its features when the
     * requirement names one). For tests needing two boards, the stub is the
     * first connected match of the stub requirements whose serial address
     * differs from the DUT's.
     *
     * @throws DocumentError if the registry cannot be read
     */
    ResolvedDevices resolve(const TestCase& test) override;

    /// Registry devices satisfying any of @p requirements, in requirement order
    static std::vector<Device> matching_devices(const std::vector<Device>& devices,
                                                const std::vector<DeviceRequirement>& requirements);

  private:
    DeviceRegistry& registry_;
    std::string registry_path_;
    std::string board_;
};

class StaticPortDeviceResolver : public DeviceResolver {
  public:
    StaticPortDeviceResolver(std::string dut_port, std::string stub_port);

    /// Always the configured ports, whatever the test requires
    ResolvedDevices resolve(const TestCase& test) override;

  private:
    std::string dut_port_;
    std::string stub_port_;
};

} // namespace hil
