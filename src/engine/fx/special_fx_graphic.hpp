#pragma once

namespace fx {
    /**
     * A live instance of a visual effect
     */
    class SpecialFxGraphic {
    public:
        virtual ~SpecialFxGraphic() = default;

        /**
         * Asks the effect to wind down. It stops emitting and goes away once its existing particles die off
         */
        virtual void shutdown() = 0;

        /**
         * Whether the effect is still around. Effects that have finished playing, or that finished shutting down,
         * are not alive
         */
        virtual bool is_alive() const = 0;
    };
} // fx
