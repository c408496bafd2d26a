#include "comms/AppServer.h"

#include "Pins.h"

/*
===============================================================================
  AppServer.cpp
===============================================================================

  Key behavior:
  - LED toggles every second while joining, solid on once connected,
    off if the join failed
  - A second client is refused while one is connected
  - Client disconnect publishes STOP through CommandLink
===============================================================================
*/

AppServer::AppServer(CommandLink& link, const NetworkConfig& cfg, uint8_t led_pin)
: _link(link),
  _cfg(cfg),
  _led_pin(led_pin),
  _server(cfg.port)
{
}

bool AppServer::begin() {
  pinMode(_led_pin, OUTPUT);
  digitalWrite(_led_pin, LOW);

  WiFi.mode(WIFI_STA);
  WiFi.begin(_cfg.ssid, _cfg.password);

  SERIAL_USB.print("Connecting to WiFi");

  bool led = false;
  const uint32_t t0 = millis();
  while (WiFi.status() != WL_CONNECTED && (millis() - t0) < _cfg.connect_timeout_ms) {
    SERIAL_USB.print('.');
    led = !led;
    digitalWrite(_led_pin, led ? HIGH : LOW);
    delay(1000);
  }
  SERIAL_USB.println();

  if (WiFi.status() != WL_CONNECTED) {
    SERIAL_USB.println("WiFi connection FAILED!");
    digitalWrite(_led_pin, LOW);
    _wifi_up = false;
    return false;
  }

  _wifi_up = true;

  _server.begin();
  digitalWrite(_led_pin, HIGH);

  SERIAL_USB.print("WiFi connected, app server ");
  SERIAL_USB.print(WiFi.localIP());
  SERIAL_USB.print(':');
  SERIAL_USB.println(_cfg.port);
  return true;
}

void AppServer::acceptClient_() {
  WiFiClient incoming = _server.accept();
  if (!incoming) return;

  if (_client_connected) {
    incoming.println("ERROR");
    incoming.stop();
    return;
  }

  _client = incoming;
  _client_connected = true;

  SERIAL_USB.print("APP CONNECTED: ");
  SERIAL_USB.println(_client.remoteIP());
}

void AppServer::tick(uint32_t now_ms) {
  if (!_wifi_up) return;

  acceptClient_();

  if (!_client_connected) return;

  if (!_client.connected()) {
    _client.stop();
    _client_connected = false;
    _link.onDisconnect(now_ms);
    SERIAL_USB.println("App disconnected");
    return;
  }

  char buf[128];
  while (_client.available() > 0) {
    const int n = _client.read((uint8_t*)buf, sizeof(buf));
    if (n <= 0) break;
    _link.feed(buf, (size_t)n, now_ms, *this);
  }
}

void AppServer::sendLine(const char* line) {
  if (!_client_connected || !_client.connected()) return;
  _client.print(line);
  _client.print('\n');
}
