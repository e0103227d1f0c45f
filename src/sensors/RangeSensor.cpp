#include "sensors/RangeSensor.h"

#include <algorithm>
#include <math.h>

#include "utils/Log.h"

/*
  RangeSensor.cpp

  Ping sequence (HC-SR04):
    TRIG low 2 us -> TRIG high 10 us -> TRIG low
    ECHO rises when the burst leaves, falls when the echo returns
    echo width = round-trip time of flight

  Each edge wait has its own deadline. A missed edge is a failed sample for
  this call only; the filter window keeps its previous readings.
*/

static const char* TAG = "Range";

RangeSensor::RangeSensor(GpioPort& port,
                         uint8_t trig_pin,
                         uint8_t echo_pin,
                         uint32_t timeout_us,
                         uint8_t buffer_size,
                         float temp_c)
: _port(port),
  _trig_pin(trig_pin),
  _echo_pin(echo_pin),
  _timeout_us(timeout_us),
  _buffer_size(buffer_size),
  _temp_c(temp_c),
  _enabled(true)
{
  if (_buffer_size == 0) _buffer_size = 1;
  if (_buffer_size > DISTANCE_BUFFER_MAX) _buffer_size = DISTANCE_BUFFER_MAX;
  if (_timeout_us == 0) _timeout_us = ECHO_TIMEOUT_US;

  for (uint8_t i = 0; i < DISTANCE_BUFFER_MAX; ++i) _buf[i] = 0.0f;
}

bool RangeSensor::begin() {
  if (!_port.pinMode(_trig_pin, PinMode::OUTPUT)) {
    LOG_E(TAG, "cannot claim TRIG line %u", (unsigned)_trig_pin);
    return false;
  }
  if (!_port.pinMode(_echo_pin, PinMode::INPUT)) {
    LOG_E(TAG, "cannot claim ECHO line %u", (unsigned)_echo_pin);
    return false;
  }

  _port.digitalWrite(_trig_pin, false);

  LOG_I(TAG, "ready, window %u, timeout %lu us, %.1f C",
        (unsigned)_buffer_size, (unsigned long)_timeout_us, (double)temperatureC());
  return true;
}

void RangeSensor::setTemperatureC(float temp_c) {
  std::lock_guard<std::mutex> lock(_mutex);
  _temp_c = temp_c;
}

float RangeSensor::temperatureC() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _temp_c;
}

void RangeSensor::clearHistory() {
  std::lock_guard<std::mutex> lock(_mutex);
  _head = 0;
  _count = 0;
  _state.samples = 0;
}

RangeSensor::State RangeSensor::getState() const {
  std::lock_guard<std::mutex> lock(_mutex);
  State s = _state;
  s.enabled = _enabled.load();
  return s;
}

bool RangeSensor::waitForEcho_(bool level, uint32_t since_us, uint32_t& edge_us) {
  while (_port.digitalRead(_echo_pin) != level) {
    if ((uint32_t)(_port.micros() - since_us) > _timeout_us) return false;
  }
  edge_us = _port.micros();
  return true;
}

bool RangeSensor::ping_(uint32_t& echo_us, const char*& failed_edge) {
  _port.digitalWrite(_trig_pin, false);
  _port.delayMicroseconds(2);
  _port.digitalWrite(_trig_pin, true);
  _port.delayMicroseconds(10);
  _port.digitalWrite(_trig_pin, false);

  uint32_t rise_us = 0;
  if (!waitForEcho_(true, _port.micros(), rise_us)) {
    failed_edge = "rise";
    return false;
  }

  uint32_t fall_us = 0;
  if (!waitForEcho_(false, rise_us, fall_us)) {
    failed_edge = "fall";
    return false;
  }

  echo_us = fall_us - rise_us;
  return true;
}

float RangeSensor::push_(float cm) {
  _buf[_head] = cm;
  _head = (uint8_t)((_head + 1) % _buffer_size);
  if (_count < _buffer_size) _count++;
  return median_();
}

float RangeSensor::median_() const {
  if (_count == 0) return -1.0f;

  float sorted[DISTANCE_BUFFER_MAX];
  for (uint8_t i = 0; i < _count; ++i) sorted[i] = _buf[i];
  std::sort(sorted, sorted + _count);

  const uint8_t mid = _count / 2;
  const float m = (_count % 2 != 0) ? sorted[mid]
                                    : 0.5f * (sorted[mid - 1] + sorted[mid]);

  return roundf(m * 100.0f) / 100.0f;
}

RangeSensor::Sample RangeSensor::measure(uint32_t now_ms) {
  Sample out;

  if (!_enabled.load()) {
    out.status = Status::DISABLED;
    return out;
  }

  std::lock_guard<std::mutex> ping_lock(_ping_mutex);

  uint32_t echo_us = 0;
  const char* failed_edge = "";
  const bool ok = ping_(echo_us, failed_edge);

  // Switched off mid-ping (rotation started): the echo no longer counts
  if (!_enabled.load()) {
    LOG_D(TAG, "detection off during ping, sample discarded");
    out.status = Status::DISABLED;
    return out;
  }

  std::lock_guard<std::mutex> lock(_mutex);
  _state.last_update_ms = now_ms;

  if (!ok) {
    _state.valid = false;
    _state.raw_cm = -1.0f;
    _state.failures++;
    if (_fail_streak++ == 0) {
      LOG_W(TAG, "echo timeout (%s), keeping %u buffered readings",
            failed_edge, (unsigned)_count);
    }
    out.status = Status::FAILED;
    return out;
  }

  if (_fail_streak > 1) {
    LOG_I(TAG, "echo back after %lu failed pings", (unsigned long)_fail_streak);
  }
  _fail_streak = 0;

  const float raw = echoToCm(echo_us, _temp_c);
  const float filtered = push_(raw);

  _state.raw_cm = raw;
  _state.distance_cm = filtered;
  _state.valid = true;
  _state.samples = _count;

  out.status = Status::OK;
  out.distance_cm = filtered;
  return out;
}
