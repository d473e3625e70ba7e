#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <memory>
#include <numbers>
#include <stdexcept>
#include <string>

#include "impetus-sim/src/DataTypes/WorldAxes.hpp"
#include "impetus-sim/src/Engine.hpp"
#include "impetus-sim/src/Noise/PerlinNoise1D.hpp"

using namespace impetus_sim;

namespace
{

// SDL_Keycode values for the scripted keys
constexpr KeyCode kKeySpace = 0x20;
constexpr KeyCode kKeyW = 'w';

constexpr std::chrono::milliseconds kFrameTime{16};

void configureLogging()
{
  auto logger = spdlog::stdout_color_mt("impetus");
  logger->set_level(spdlog::level::info);

  const char* level = std::getenv("IMPETUS_LOG_LEVEL");
  if (level != nullptr && std::string{level} == "debug")
  {
    logger->set_level(spdlog::level::debug);
  }

  spdlog::set_default_logger(logger);
}

int parseFrameCount(int argc, char** argv)
{
  if (argc < 2)
  {
    return 240;
  }

  int const frames = std::stoi(argv[1]);
  if (frames <= 0)
  {
    throw std::invalid_argument("Frame count must be positive, got: " +
                                std::string{argv[1]});
  }
  return frames;
}

/**
 * @brief A crate on a floor with a jump rule, a thruster rule and a gusty
 *        wind tunnel a few metres ahead of it
 */
uint32_t buildScenario(Engine& engine)
{
  WorldModel& world = engine.getWorldModel();

  world.spawnEnvironmentObject(ReferenceFrame{Coordinate{0.0, 0.0, -0.5}},
                               BoxCollider{Coordinate{50.0, 50.0, 0.5}});

  AssetInertial& crate =
    world.spawnInertialObject(ReferenceFrame{Coordinate{0.0, 0.0, 0.5}},
                              10.0,
                              BoxCollider{Coordinate{0.5, 0.5, 0.5}});

  // Tunnel blows along +Y
  Eigen::Quaterniond const sideways{
    Eigen::AngleAxisd{std::numbers::pi / 2.0, Eigen::Vector3d::UnitZ()}};
  const AssetTrigger& tunnel = world.spawnTriggerVolume(
    ReferenceFrame{Coordinate{6.0, 0.0, 2.0}, sideways},
    BoxCollider{Coordinate{2.0, 2.0, 2.0}});

  ForceRule jump;
  jump.triggerKey = kKeySpace;
  jump.requiresGrounded = true;
  jump.strength = 50.0;
  jump.direction = WorldAxes::up();
  jump.relativeToOwner = false;

  ForceRule thruster;
  thruster.triggerKey = kKeyW;
  thruster.continuous = true;
  thruster.strength = 40.0;
  thruster.speedCap = 4.0;
  thruster.direction = WorldAxes::forward();

  engine.addForceRuleEvaluator(crate.getInstanceId(), {jump, thruster});

  WindZoneConfig gusty;
  gusty.baseForce = 60.0;
  gusty.useVariation = true;
  gusty.variationFrequency = 2.0;
  gusty.minForce = 20.0;
  engine.addWindZone(tunnel.getInstanceId(),
                     gusty,
                     std::make_shared<PerlinNoise1D>(7u, 3));

  return crate.getInstanceId();
}

void logBody(const Engine& engine, uint32_t bodyId, int frame)
{
  const InertialState& state =
    engine.getWorldModel().getInertial(bodyId).getInertialState();
  const ForceRuleEvaluator& evaluator = *engine.getEvaluators().front();
  const WindZone& wind = *engine.getWindZones().front();

  spdlog::info("frame {:4d} pos [{:7.3f}, {:7.3f}, {:7.3f}] speed {:6.3f} "
               "grounded {} wind {:6.2f} N",
               frame,
               state.position.x(),
               state.position.y(),
               state.position.z(),
               state.speed(),
               evaluator.isGrounded(),
               wind.getCurrentForce());
}

}  // namespace

int main(int argc, char** argv)
{
  try
  {
    configureLogging();
    int const frames = parseFrameCount(argc, argv);

    Engine engine;
    uint32_t const crateId = buildScenario(engine);

    spdlog::info("Running {} frames", frames);
    for (int frame = 1; frame <= frames; ++frame)
    {
      // Scripted input: hop early, then thrust forward into the tunnel
      engine.setKeyState(kKeySpace, frame == 20);
      engine.setKeyState(kKeyW, frame >= 60 && frame < 200);

      engine.update(kFrameTime * frame);

      if (frame % 30 == 0 || frame == frames)
      {
        logBody(engine, crateId, frame);
      }
    }
  }
  catch (const std::exception& e)
  {
    spdlog::error("impetus-exe failed: {}", e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
