// SPDX-License-Identifier: MIT
#include <cstdlib>
#include <exception>

#include <glow/common/log.hh>

#include <animation/ConfigurationError.hh>
#include <demo/Demo.hh>

int main()
{
    constexpr float frameTime = 1.f / 60.f;
    constexpr float bpm = 128.f;
    constexpr float runSeconds = 8.f;

    try
    {
        Demo::System demo(bpm);
        demo.addPlatform(tg::pos3(0, 0, 0), Demo::elevatorConfig());
        demo.addPlatform(tg::pos3(6, 2, 0), Demo::spinnerConfig());

        // log four times per beat
        float logInterval = 60.f / bpm / 4.f;
        float sinceLog = 0.f;
        for (float time = 0.f; time < runSeconds; time += frameTime)
        {
            demo.update(frameTime);
            sinceLog += frameTime;
            if (sinceLog >= logInterval)
            {
                sinceLog -= logInterval;
                demo.logState();
            }
        }
    }
    catch (const BeatMotion::ConfigurationError& e)
    {
        glow::error() << "invalid animation configuration: " << e.what();
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
