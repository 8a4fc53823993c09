#include "prism/mesh/GeometryProcessor.hpp"
#include "prism/core/common.hpp"
#include "prism/core/logger.hpp"
#include <mikktspace.h>
#include <limits>

namespace prism::mesh {

    namespace {
        struct TangentContext {
            MeshResource* m_mesh;

            static MeshResource& mesh(const SMikkTSpaceContext* context) {
                return *static_cast<TangentContext*>(context->m_pUserData)->m_mesh;
            }

            static uint32_t vertexIndex(const SMikkTSpaceContext* context, const int iFace, const int iVert) {
                return mesh(context).indices[(iFace * 3) + iVert];
            }

            static int getNumFaces(const SMikkTSpaceContext* context) {
                return (int)(mesh(context).indices.size() / 3);
            }

            static int getNumVerticesOfFace(const SMikkTSpaceContext*, const int) {
                return 3;
            }

            static void getPosition(const SMikkTSpaceContext* context, float fvPosOut[], const int iFace, const int iVert) {
                const auto& pos = mesh(context).vertices[vertexIndex(context, iFace, iVert)].position;
                fvPosOut[0] = pos.x;
                fvPosOut[1] = pos.y;
                fvPosOut[2] = pos.z;
            }

            static void getNormal(const SMikkTSpaceContext* context, float fvNormOut[], const int iFace, const int iVert) {
                const auto& norm = mesh(context).vertices[vertexIndex(context, iFace, iVert)].normal;
                fvNormOut[0] = norm.x;
                fvNormOut[1] = norm.y;
                fvNormOut[2] = norm.z;
            }

            static void getTexCoord(const SMikkTSpaceContext* context, float fvTexcOut[], const int iFace, const int iVert) {
                const auto& uv = mesh(context).vertices[vertexIndex(context, iFace, iVert)].uv0;
                fvTexcOut[0] = uv.x;
                fvTexcOut[1] = uv.y;
            }

            static void setTSpaceBasic(const SMikkTSpaceContext* context, const float fvTangent[], const float fSign, const int iFace, const int iVert) {
                mesh(context).tangents[vertexIndex(context, iFace, iVert)] =
                    glm::vec4(fvTangent[0], fvTangent[1], fvTangent[2], fSign);
            }
        };
    }

    BoundingBox GeometryProcessor::computeBounds(const std::vector<MeshVertex>& vertices)
    {
        if (vertices.empty()) {
            return {};
        }

        glm::vec3 pMin(std::numeric_limits<float>::max());
        glm::vec3 pMax(std::numeric_limits<float>::lowest());
        for (const auto& v : vertices)
        {
            pMin = glm::min(pMin, v.position);
            pMax = glm::max(pMax, v.position);
        }
        return {pMin, pMax};
    }

    void GeometryProcessor::recalculateNormals(std::vector<MeshVertex>& vertices, const std::vector<uint32_t>& indices)
    {
        PRISM_PROFILE_FUNCTION();

        for (auto& v : vertices) {
            v.normal = glm::vec3(0.0F);
        }

        for (size_t i = 0; i + 2 < indices.size(); i += 3)
        {
            MeshVertex& va = vertices[indices[i]];
            MeshVertex& vb = vertices[indices[i + 1]];
            MeshVertex& vc = vertices[indices[i + 2]];

            // Length of the cross product is twice the triangle area.
            const glm::vec3 n = glm::cross(vb.position - va.position, vc.position - va.position);
            va.normal += n;
            vb.normal += n;
            vc.normal += n;
        }

        for (auto& v : vertices)
        {
            const float len = glm::length(v.normal);
            v.normal = len > 0.0F ? v.normal / len : glm::vec3(0.0F);
        }
    }

    void GeometryProcessor::generateTangents(MeshResource& mesh) {
        mesh.tangents.assign(mesh.vertices.size(), glm::vec4(1.0F, 0.0F, 0.0F, 1.0F));
        if (mesh.indices.size() < 3) {
            return;
        }

        TangentContext userContext{};
        userContext.m_mesh = &mesh;

        SMikkTSpaceInterface iface{};
        iface.m_getNumFaces = TangentContext::getNumFaces;
        iface.m_getNumVerticesOfFace = TangentContext::getNumVerticesOfFace;
        iface.m_getPosition = TangentContext::getPosition;
        iface.m_getNormal = TangentContext::getNormal;
        iface.m_getTexCoord = TangentContext::getTexCoord;
        iface.m_setTSpaceBasic = TangentContext::setTSpaceBasic;

        SMikkTSpaceContext context{};
        context.m_pInterface = &iface;
        context.m_pUserData = &userContext;

        core::Logger::Mesh.debug("Generating tangents for mesh with {} vertices and {} indices.", mesh.vertices.size(), mesh.indices.size());
        if (genTangSpaceDefault(&context) == 0) {
            core::Logger::Mesh.warn("MikkTSpace failed for mesh '{}', keeping default tangents.", mesh.name);
        }
    }

}
