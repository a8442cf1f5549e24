#pragma once

enum class Direction{ APPLYING,SEPARATING,STATIONARY };

constexpr double STATION_EPS=0.01;

const char*dir_name(Direction d);

// One-step finite difference; speeds and the step share the provider's
// time unit (deg/day).
Direction classify_dir(double lon_a,double spd_a,double lon_b,double spd_b,
					   double aspect_angle,double eps=STATION_EPS);
