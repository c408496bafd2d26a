#pragma once

/*
  WifiSecrets.h

  Purpose:
  Phone hotspot credentials for the robot.

  1. Create a phone hotspot with a simple name (e.g. "Team1", "Robot2")
  2. Put the hotspot name and password below
  3. Upload, then read the IP address from the serial monitor
*/

#define WIFI_SSID     "YourHotspotName"
#define WIFI_PASSWORD "YourPassword"
