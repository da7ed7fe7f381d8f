/*
    Copyright 2023-2025 Zaden Ruggiero-Bouné

    This file is part of GCJoy.

    GCJoy is free software: you can redistribute it and/or modify it under
   the terms of the GNU General Public License as published by the Free Software
   Foundation, either version 3 of the License, or (at your option) any later
   version.

    GCJoy is distributed in the hope that it will be useful, but WITHOUT ANY
   WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
   A PARTICULAR PURPOSE. See the GNU General Public License for more details.

    You should have received a copy of the GNU General Public License along with
   GCJoy. If not, see http://www.gnu.org/licenses/.
*/

#include "pio_link.hpp"

#include "hardware/clocks.h"
#include "hardware/dma.h"
#include "hardware/irq.h"
#include "joybus.pio.h"
#include "joybus_timing.hpp"
#include "pico/time.h"

static_assert(joybus_CYCLES_PER_US == CODEC_CYCLES_PER_US,
              "codec clock differs from the timing model");
static_assert((joybus_T_LOW + joybus_T_DATA + joybus_T_HIGH) * 1000 ==
                  CONTROLLER_BIT_NS * joybus_CYCLES_PER_US,
              "codec bit period differs from the timing model");
static_assert(joybus_STOP_LOW * 1000 ==
                  CONTROLLER_STOP_LOW_NS * joybus_CYCLES_PER_US,
              "codec stop bit differs from the timing model");

// rx_bit starts at least 2 and less than 6 cycles after a falling edge. A
// window edge is checked at its earliest test point, the noise band next to it
// at its latest.
constexpr uint32_t CODEC_NS_PER_CYCLE = 1000 / joybus_CYCLES_PER_US;
constexpr uint32_t ONE_WINDOW_TEST =
    joybus_EDGE_LATENCY + joybus_GLITCH_DELAY + joybus_ONE_WINDOW_DELAY + 2;
constexpr uint32_t ZERO_WINDOW_TEST =
    ONE_WINDOW_TEST + joybus_ZERO_WINDOW_DELAY + 1;
constexpr uint32_t ZERO_LIMIT_TEST =
    ZERO_WINDOW_TEST + joybus_ZERO_LIMIT_DELAY + 1;

static_assert(joybus_EDGE_JITTER * CODEC_NS_PER_CYCLE == CODEC_EDGE_JITTER_NS,
              "codec edge jitter differs from the timing model");
static_assert((joybus_EDGE_LATENCY + joybus_EDGE_JITTER + joybus_GLITCH_DELAY +
               1) * CODEC_NS_PER_CYCLE ==
                  ONE_WINDOW_START_NS,
              "codec glitch test differs from the timing model");
static_assert(ONE_WINDOW_TEST * CODEC_NS_PER_CYCLE == ONE_WINDOW_END_NS,
              "codec one window differs from the timing model");
static_assert((ZERO_WINDOW_TEST + joybus_EDGE_JITTER) * CODEC_NS_PER_CYCLE ==
                  ZERO_WINDOW_START_NS,
              "codec zero window start differs from the timing model");
static_assert(ZERO_LIMIT_TEST * CODEC_NS_PER_CYCLE == ZERO_WINDOW_END_NS,
              "codec zero window end differs from the timing model");
// A 1 enters the gap loop right after the zero window test, each pass is 4
// cycles
static_assert((ZERO_WINDOW_TEST + 1 + 4 * joybus_GAP_LOOPS) *
                      CODEC_NS_PER_CYCLE >=
                  FRAME_END_NS,
              "codec gap loop ends before the timing model's frame end");

joybus_protocol *console_protocol = nullptr;
uint joybus_irq;

void handle_console_request() {
  // Disable IRQ to avoid interrupt reentrancy
  irq_set_enabled(joybus_irq, false);

  // Stay until the response is out, the codec pushes nothing while sending
  do {
    console_protocol->service();
  } while (console_protocol->current_state() ==
           protocol_state::transmitting);

  irq_set_enabled(joybus_irq, true);
}

pio_link::pio_link(PIO pio, uint pin) : pio_(pio) {
  offset_ = pio_add_program(pio_, &joybus_program);
  sm_ = pio_claim_unused_sm(pio_, true);

  // Joybus TX DMA
  dma_ = dma_claim_unused_channel(true);
  dma_channel_config tx_config = dma_channel_get_default_config(dma_);
  channel_config_set_dreq(&tx_config, pio_get_dreq(pio_, sm_, true));
  channel_config_set_transfer_data_size(&tx_config, DMA_SIZE_32);
  channel_config_set_read_increment(&tx_config, true);
  channel_config_set_write_increment(&tx_config, false);
  dma_channel_set_config(dma_, &tx_config, false);
  dma_channel_set_write_addr(dma_, &pio_->txf[sm_], false);

  joybus_program_init(pio_, sm_, offset_, pin,
                      joybus_clock_divider(clock_get_hz(clk_sys)));
}

void pio_link::listen(joybus_protocol &protocol) {
  console_protocol = &protocol;
  joybus_irq = pio_get_index(pio_) == 0 ? PIO0_IRQ_0 : PIO1_IRQ_0;

  // Joybus RX IRQ
  irq_set_exclusive_handler(joybus_irq, handle_console_request);
  irq_set_enabled(joybus_irq, true);
  pio_set_irq0_source_enabled(
      pio_, static_cast<pio_interrupt_source>(pis_sm0_rx_fifo_not_empty + sm_),
      true);
}

bool pio_link::rx_empty() { return pio_sm_is_rx_fifo_empty(pio_, sm_); }

uint32_t pio_link::rx_get() { return pio_sm_get(pio_, sm_); }

bool pio_link::rx_overflowed() {
  uint32_t stall_mask = 1u << (PIO_FDEBUG_RXSTALL_LSB + sm_);
  if ((pio_->fdebug & stall_mask) == 0) {
    return false;
  }

  // Write 1 to clear
  pio_->fdebug = stall_mask;
  return true;
}

void pio_link::discard_rx() {
  while (!pio_sm_is_rx_fifo_empty(pio_, sm_)) {
    pio_sm_get(pio_, sm_);
  }
}

void pio_link::transmit(const uint32_t *words, size_t length) {
  dma_channel_transfer_from_buffer_now(dma_, words, length);
}

bool pio_link::transmit_done() {
  if (dma_channel_is_busy(dma_) || !pio_sm_is_tx_fifo_empty(pio_, sm_)) {
    return false;
  }

  // Wait for the codec to finish the last byte and the stop bit
  uint idle = offset_ + joybus_offset_rx_idle;
  uint pc = pio_sm_get_pc(pio_, sm_);
  if (pc < idle || pc > idle + 2) {
    return false;
  }

  // Drop the console stop bit sample left in the ISR before the response
  pio_sm_exec(pio_, sm_, pio_encode_mov(pio_isr, pio_null));
  return true;
}

uint64_t pio_link::now_us() { return time_us_64(); }
