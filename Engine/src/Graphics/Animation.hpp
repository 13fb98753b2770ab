#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace vu
{

// A named range of frames within an animation.
struct Movement
{
    std::string name;
    int f0 = 0;        // first frame
    int fn = 0;        // number of frames
    double rate = 0.0; // frames per second, r_anim_rate when not positive
};

// Convert between an affine transform and the 3x4 pose layout uploaded to
// shaders (the first three rows of the transform).
glm::mat3x4 toPoseMatrix(const glm::mat4& transform);
glm::mat4 fromPoseMatrix(const glm::mat3x4& pose);

// Keyframed joint transforms shared by any number of models. Per model state
// (current frame and pose) is kept by the model.
class Animation
{
private:
    std::string name;
    size_t joint_count;
    std::vector<glm::mat4> frames; // frame count * joint count
    std::vector<int32_t> joints;   // parent index per joint, -1 for roots
    std::vector<Movement> movements;

public:
    explicit Animation(const std::string& name);

    // Parents must come before their children in the joint list.
    void setData(const std::vector<glm::mat4>& frame_data, const std::vector<int32_t>& parents,
                 const std::vector<Movement>& moves);

    const std::string& getName() const { return name; }
    size_t getJointCount() const { return joint_count; }
    size_t getFrameCount() const;
    const std::vector<Movement>& getMovements() const { return movements; }
    std::vector<std::string> getMovementNames() const;

    void setRate(int movement, double rate);

    // Returns movement when it exists, otherwise 0
    int playMovement(int movement) const;

    // Number of frames in the movement, 0 when unknown
    int maxFrames(int movement) const;

    // Advance frame by dt and write one pose matrix per joint, interpolated
    // between the two nearest frames and composed with the parent joint.
    // Returns the new frame position.
    double animate(double dt, double frame, int movement, std::vector<glm::mat3x4>& pose) const;
};

}
