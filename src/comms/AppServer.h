#pragma once
#include <Arduino.h>
#include <WiFi.h>

#include "comms/CommandLink.h"
#include "control/RobotConfig.h"

/*
===============================================================================
  AppServer.h
===============================================================================

  PURPOSE
  -------
  Wi-Fi side of the phone app link:

    - Join the phone hotspot (station mode), blinking the LED meanwhile
    - Listen on the app port, one client at a time
    - Move received bytes into CommandLink, write its replies back

  tick() never blocks: it only reads what the client already sent.
===============================================================================
*/

class AppServer : public ReplySink {
public:
  AppServer(CommandLink& link, const NetworkConfig& cfg, uint8_t led_pin);

  // Connects to Wi-Fi and starts listening. Blocks up to
  // cfg.connect_timeout_ms. Returns false if the network never came up.
  bool begin();

  void tick(uint32_t now_ms);

  void sendLine(const char* line) override;

  bool clientConnected() const { return _client_connected; }

private:
  void acceptClient_();

  CommandLink& _link;
  NetworkConfig _cfg;
  uint8_t _led_pin;

  WiFiServer _server;
  WiFiClient _client;

  bool _wifi_up = false;
  bool _client_connected = false;
};
