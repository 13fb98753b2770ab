#include "Animation.hpp"
#include "Console/ConVar.hpp"
#include "Utils/Log.hpp"
#include <algorithm>
#include <cmath>

namespace vu
{

glm::mat3x4 toPoseMatrix(const glm::mat4& transform)
{
    // glm is column major: the transposed columns are the transform's rows
    return glm::mat3x4(glm::transpose(transform));
}

glm::mat4 fromPoseMatrix(const glm::mat3x4& pose)
{
    return glm::transpose(glm::mat4(pose));
}

Animation::Animation(const std::string& name)
    : name(name), joint_count(0)
{
}

void Animation::setData(const std::vector<glm::mat4>& frame_data, const std::vector<int32_t>& parents,
                        const std::vector<Movement>& moves)
{
    ConVarBase* anim_rate = VU_CVAR_PTR(r_anim_rate);
    const double default_rate = anim_rate ? anim_rate->getFloat() : 24.0;

    joint_count = parents.size();
    frames = frame_data;
    joints = parents;
    movements = moves;
    for (Movement& movement : movements)
    {
        if (movement.rate <= 0.0)
        {
            movement.rate = default_rate;
        }
    }

    if (joint_count > 0 && frames.size() % joint_count != 0)
    {
        VU_LOG_WARN("Animation '{}': {} frame matrices for {} joints", name, frames.size(), joint_count);
    }
}

size_t Animation::getFrameCount() const
{
    return joint_count > 0 ? frames.size() / joint_count : 0;
}

std::vector<std::string> Animation::getMovementNames() const
{
    std::vector<std::string> names;
    names.reserve(movements.size());
    for (const Movement& movement : movements)
    {
        names.push_back(movement.name);
    }
    return names;
}

void Animation::setRate(int movement, double rate)
{
    if (movement >= 0 && movement < static_cast<int>(movements.size()))
    {
        movements[movement].rate = rate;
    }
}

int Animation::playMovement(int movement) const
{
    if (movement >= 0 && movement < static_cast<int>(movements.size()))
    {
        return movement;
    }
    return 0;
}

int Animation::maxFrames(int movement) const
{
    if (movement >= 0 && movement < static_cast<int>(movements.size()))
    {
        return movements[movement].fn;
    }
    return 0;
}

double Animation::animate(double dt, double frame, int movement, std::vector<glm::mat3x4>& pose) const
{
    if (movements.empty() || joint_count == 0)
    {
        return 0.0;
    }
    const Movement& mv = movements[playMovement(movement)];
    if (mv.fn <= 0)
    {
        return 0.0;
    }

    frame += dt * mv.rate;

    // Interpolate between the two closest frames, wrapped into the movement.
    const double whole = std::floor(frame);
    const float weight = static_cast<float>(frame - whole);
    const int frame1 = static_cast<int>(whole) % mv.fn + mv.f0;
    const int frame2 = (static_cast<int>(whole) + 1) % mv.fn + mv.f0;
    if (frame1 < 0 || frame2 < 0 || static_cast<size_t>(std::max(frame1, frame2) + 1) * joint_count > frames.size())
    {
        VU_LOG_WARN("Animation '{}': movement '{}' reaches past the last frame", name, mv.name);
        return frame;
    }

    pose.resize(joint_count);
    std::vector<glm::mat4> composed(joint_count);
    for (size_t joint = 0; joint < joint_count; joint++)
    {
        const glm::mat4& m1 = frames[frame1 * joint_count + joint];
        const glm::mat4& m2 = frames[frame2 * joint_count + joint];
        glm::mat4 transform = m1 * (1.0f - weight) + m2 * weight;

        const int32_t parent = joints[joint];
        if (parent >= 0 && static_cast<size_t>(parent) < joint)
        {
            transform = composed[parent] * transform;
        }
        composed[joint] = transform;
        pose[joint] = toPoseMatrix(transform);
    }
    return frame;
}

}
